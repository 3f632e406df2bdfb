/**
 * adau1467.hpp
 *
 * Analog Devices ADAU1467 SPI slave model.
 * Provides storage for the control registers and the paged data/program
 * memories, plus the software safeload. The DSP core itself is not
 * simulated.
 *
 *   Variant     DataMem ProgMem (kwords)
 *   ADAU1463    48      16
 *   ADAU1467    80      24
 */

#ifndef ADAU1467_HPP
#define ADAU1467_HPP

#include "common.hpp"
#include "log.hpp"
#include "peripheral.hpp"
#include "register_bank.hpp"
#include "memory.hpp"
#include "safeload.hpp"
#include "decoder.hpp"

struct DeviceConfig {
    std::string variant = "ADAU1467";
    Byte chip_address = 0x00;       // Expected bits [7:1] of the first byte
};

class Adau1467 : public SpiPeripheral, public GpioReceiver, public BusTarget {
public:
    static constexpr int CHIP_SELECT_PIN = 0;   // Active low
    static constexpr int RESET_PIN = 31;        // nRESET, active low

    explicit Adau1467(Logger& log, const DeviceConfig& config = DeviceConfig());

    // SpiPeripheral
    Byte transmit(Byte data) override;
    void finish_transmission() override;

    // GpioReceiver
    void on_gpio(int pin, bool level) override;

    // Registers back to defaults, decoder idle; memory is kept
    void reset();

    // BusTarget (live protocol path)
    HalfWord read_control(Address addr) override;
    void write_control(Address addr, HalfWord value) override;
    Word read_memory(Address addr) override;
    void write_memory(Address addr, Word value) override;

    // Page-qualified memory access
    Word read_memory(Address addr, PageOverride override);
    void write_memory(Address addr, Word value, PageOverride override);
    std::vector<Word> read_memory_block(Address start, size_t count, Page page);

    // Components
    const RegisterBank& registers() const;
    const MemoryBanks& memory() const;
    const ProtocolDecoder& decoder() const;
    const SafeloadEngine& safeload() const;
    Page get_page() const;
    const std::string& get_variant() const;

    // Stats
    uint64_t get_control_read_count() const;
    uint64_t get_control_write_count() const;
    uint64_t get_reset_count() const;

private:
    Logger& log;
    DeviceConfig config;
    RegisterBank regs;
    MemoryBanks mem;
    SafeloadEngine safeloader;
    ProtocolDecoder proto;

    bool reset_level;
    uint64_t control_reads;
    uint64_t control_writes;
    uint64_t resets;

    void apply_side_effect(const WriteResult& result);
    void sync_page();
};

#endif // ADAU1467_HPP
