/**
 * spi_host.cpp
 *
 * Implementation of the SPI transaction framing.
 */

#include "spi_host.hpp"
#include "address_space.hpp"

SpiHost::SpiHost(SpiPeripheral& device, Byte chip_address)
    : device(device), chip_address(chip_address & 0x7F), bytes(0) {}

std::vector<Byte> SpiHost::transfer(const std::vector<Byte>& out) {
    std::vector<Byte> in;
    in.reserve(out.size());
    for (Byte b : out) {
        in.push_back(device.transmit(b));
        bytes++;
    }
    return in;
}

void SpiHost::deselect() {
    device.finish_transmission();
}

std::vector<Byte> SpiHost::header(Address addr, bool read) const {
    return {
        static_cast<Byte>((chip_address << 1) | (read ? 1 : 0)),
        static_cast<Byte>(addr >> 8),
        static_cast<Byte>(addr & 0xFF)
    };
}

// =============================================================================
// Transactions
// =============================================================================

void SpiHost::write_words(Address addr, const std::vector<Word>& words) {
    int width = AddressSpace::word_bytes(addr);
    std::vector<Byte> frame = header(addr, false);

    // Big-endian, most significant byte first
    for (Word w : words) {
        for (int i = width - 1; i >= 0; i--) {
            frame.push_back(static_cast<Byte>((w >> (8 * i)) & 0xFF));
        }
    }
    transfer(frame);
    deselect();
}

std::vector<Word> SpiHost::read_words(Address addr, size_t count) {
    int width = AddressSpace::word_bytes(addr);
    std::vector<Byte> frame = header(addr, true);
    frame.resize(frame.size() + count * width, 0x00);

    std::vector<Byte> in = transfer(frame);
    deselect();

    std::vector<Word> words;
    words.reserve(count);
    for (size_t i = 0; i < count; i++) {
        Word w = 0;
        for (int j = 0; j < width; j++) {
            w = (w << 8) | in[3 + i * width + j];
        }
        words.push_back(w);
    }
    return words;
}

void SpiHost::write_word(Address addr, Word value) {
    write_words(addr, { value });
}

Word SpiHost::read_word(Address addr) {
    return read_words(addr, 1).front();
}

uint64_t SpiHost::get_byte_count() const {
    return bytes;
}
