/**
 * spi_host.hpp
 *
 * Master side of the SPI link: frames complete read and write
 * transactions for a SpiPeripheral.
 */

#ifndef SPI_HOST_HPP
#define SPI_HOST_HPP

#include "common.hpp"
#include "peripheral.hpp"

class SpiHost {
public:
    explicit SpiHost(SpiPeripheral& device, Byte chip_address = 0x00);

    // Raw bytes with chip select held; returns the bytes shifted back
    std::vector<Byte> transfer(const std::vector<Byte>& bytes);

    // Release chip select
    void deselect();

    // Complete burst transactions (chip select released at the end)
    void write_words(Address addr, const std::vector<Word>& words);
    std::vector<Word> read_words(Address addr, size_t count);

    // Single word helpers
    void write_word(Address addr, Word value);
    Word read_word(Address addr);

    uint64_t get_byte_count() const;

private:
    SpiPeripheral& device;
    Byte chip_address;
    uint64_t bytes;

    std::vector<Byte> header(Address addr, bool read) const;
};

#endif // SPI_HOST_HPP
