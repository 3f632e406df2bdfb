/**
 * decoder.cpp
 *
 * Implementation of the SPI protocol state machine.
 */

#include "decoder.hpp"
#include "address_space.hpp"

ProtocolDecoder::ProtocolDecoder(BusTarget& target, Logger& log, Byte chip_address)
    : target(target), log(log), chip_address(chip_address & 0x7F),
      state(State::ChipAddress), do_read(false), short_word(false),
      address(0), latched_read(0), latched_write(0), transactions(0) {}

// =============================================================================
// Byte Handling
// =============================================================================

Byte ProtocolDecoder::transmit(Byte data) {
    log.noisy("decoder", "Transmit: state " + state_name(state) + " data " + to_hex(data, 2));

    switch (state) {
        case State::ChipAddress:    return on_chip_address(data);
        case State::SubAddressHigh: return on_sub_address_high(data);
        case State::SubAddressLow:  return on_sub_address_low(data);
        case State::Data0:          return on_data(0, data);
        case State::Data1:          return on_data(1, data);
        case State::Data2:          return on_data(2, data);
        case State::Data3:          return on_data(3, data);
    }
    return IDLE_BYTE;
}

void ProtocolDecoder::finish_transmission() {
    state = State::ChipAddress;
    latched_write = 0;
}

Byte ProtocolDecoder::on_chip_address(Byte data) {
    if ((data >> 1) != chip_address) {
        log.warning("decoder", "Unexpected ChipAddress " + to_hex(data, 2));
    }
    do_read = (data & 0x01) != 0;
    transactions++;
    state = State::SubAddressHigh;
    return IDLE_BYTE;
}

Byte ProtocolDecoder::on_sub_address_high(Byte data) {
    address = static_cast<Address>((address & 0x00FF) | (data << 8));
    state = State::SubAddressLow;
    return IDLE_BYTE;
}

Byte ProtocolDecoder::on_sub_address_low(Byte data) {
    address = static_cast<Address>((address & 0xFF00) | data);

    // Width is fixed for the whole burst by the starting address
    short_word = AddressSpace::is_control(address);
    state = State::Data0;
    return IDLE_BYTE;
}

Byte ProtocolDecoder::on_data(int index, Byte data) {
    Byte out = IDLE_BYTE;
    int last = short_word ? 1 : 3;

    if (do_read) {
        if (index == 0) {
            latched_read = short_word ? (static_cast<Word>(target.read_control(address)) << 16)
                                      : target.read_memory(address);
        }
        out = static_cast<Byte>((latched_read >> (24 - 8 * index)) & 0xFF);
    } else {
        latched_write = (index == 0) ? data : ((latched_write << 8) | data);
    }

    if (index == last) {
        if (!do_read) commit_word();
        address++;
        state = State::Data0;
    } else {
        state = static_cast<State>(static_cast<int>(State::Data0) + index + 1);
    }
    return out;
}

void ProtocolDecoder::commit_word() {
    if (short_word) {
        target.write_control(address, static_cast<HalfWord>(latched_write));
    } else {
        target.write_memory(address, latched_write);
    }
}

// =============================================================================
// Inspection
// =============================================================================

ProtocolDecoder::State ProtocolDecoder::get_state() const {
    return state;
}

Address ProtocolDecoder::get_address() const {
    return address;
}

bool ProtocolDecoder::is_read() const {
    return do_read;
}

bool ProtocolDecoder::is_short() const {
    return short_word;
}

uint64_t ProtocolDecoder::get_transaction_count() const {
    return transactions;
}

std::string ProtocolDecoder::state_name(State s) {
    switch (s) {
        case State::ChipAddress: return "ChipAddress";
        case State::SubAddressHigh: return "SubAddressHigh";
        case State::SubAddressLow: return "SubAddressLow";
        case State::Data0: return "Data0";
        case State::Data1: return "Data1";
        case State::Data2: return "Data2";
        case State::Data3: return "Data3";
    }
    return "?";
}
