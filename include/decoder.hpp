/**
 * decoder.hpp
 *
 * SPI protocol decoder.
 * Takes one byte per call and assembles chip address, 16-bit sub-address
 * and big-endian data bytes into register or memory accesses.
 *
 *   byte 0      chip address [7:1], read/nWrite [0]
 *   byte 1..2   sub-address, high byte first
 *   byte 3..    data, 2 bytes per control register, 4 per memory word;
 *               the sub-address increments after each word (burst)
 */

#ifndef DECODER_HPP
#define DECODER_HPP

#include "common.hpp"
#include "log.hpp"

// Where decoded accesses go
class BusTarget {
public:
    virtual ~BusTarget() = default;

    virtual HalfWord read_control(Address addr) = 0;
    virtual void write_control(Address addr, HalfWord value) = 0;
    virtual Word read_memory(Address addr) = 0;
    virtual void write_memory(Address addr, Word value) = 0;
};

class ProtocolDecoder {
public:
    enum class State {
        ChipAddress,        // Idle
        SubAddressHigh,
        SubAddressLow,
        Data0,
        Data1,
        Data2,
        Data3
    };

    // Returned on every byte that does not carry read data
    static constexpr Byte IDLE_BYTE = 0x00;

    ProtocolDecoder(BusTarget& target, Logger& log, Byte chip_address = 0x00);

    // Process one byte, returns the byte shifted out
    Byte transmit(Byte data);

    // Chip select released: drop any partial transaction
    void finish_transmission();

    // Inspection
    State get_state() const;
    Address get_address() const;
    bool is_read() const;
    bool is_short() const;
    uint64_t get_transaction_count() const;

    static std::string state_name(State state);

private:
    BusTarget& target;
    Logger& log;
    Byte chip_address;

    State state;
    bool do_read;
    bool short_word;        // 16-bit control register access
    Address address;
    Word latched_read;
    Word latched_write;
    uint64_t transactions;

    // One handler per state, each returns the byte to shift out
    Byte on_chip_address(Byte data);
    Byte on_sub_address_high(Byte data);
    Byte on_sub_address_low(Byte data);
    Byte on_data(int index, Byte data);

    void commit_word();
};

#endif // DECODER_HPP
