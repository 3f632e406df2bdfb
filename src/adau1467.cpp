/**
 * adau1467.cpp
 *
 * Implementation of the ADAU1467 SPI slave model.
 */

#include "adau1467.hpp"
#include "register_map.hpp"

Adau1467::Adau1467(Logger& log, const DeviceConfig& config)
    : log(log), config(config),
      regs("adau1467", adau1467_registers(), 16, log),
      mem(log), safeloader(mem, log), proto(*this, log, config.chip_address),
      reset_level(true), control_reads(0), control_writes(0), resets(0) {
    if (config.variant != "ADAU1467" && config.variant != "ADAU1463") {
        throw std::invalid_argument("Unknown variant: " + config.variant);
    }
    reset();
    resets = 0;
}

// =============================================================================
// Signals
// =============================================================================

Byte Adau1467::transmit(Byte data) {
    return proto.transmit(data);
}

void Adau1467::finish_transmission() {
    proto.finish_transmission();
}

void Adau1467::on_gpio(int pin, bool level) {
    log.debug("adau1467", "OnGPIO: number " + std::to_string(pin) + " value " + (level ? "1" : "0"));

    if (pin == CHIP_SELECT_PIN && level) {
        log.noisy("adau1467", "Chip Select is deasserted");
        finish_transmission();
    }
    if (pin == RESET_PIN) {
        // Reset fires on the high->low edge
        if (reset_level && !level) {
            reset();
        }
        reset_level = level;
    }
}

void Adau1467::reset() {
    // RAM contents are not guaranteed to clear on reset, so keep them
    regs.reset();
    sync_page();
    proto.finish_transmission();
    resets++;
}

// =============================================================================
// Control Registers
// =============================================================================

HalfWord Adau1467::read_control(Address addr) {
    control_reads++;
    auto value = regs.read(addr);
    if (!value) {
        log.error("adau1467", "Read from unknown control register " + to_hex(addr, 4));
        return 0;
    }
    log.debug("adau1467", "READ  ctl addr " + to_hex(addr, 4) + " value " + to_hex(*value, 4));
    return static_cast<HalfWord>(*value);
}

void Adau1467::write_control(Address addr, HalfWord value) {
    control_writes++;
    WriteResult result = regs.write(addr, value);
    if (!result.found) return;

    log.debug("adau1467", "WRITE ctl addr " + to_hex(addr, 4) + " value " + to_hex(value, 4));
    apply_side_effect(result);
}

void Adau1467::apply_side_effect(const WriteResult& result) {
    switch (result.effect) {
        case SideEffect::PageSelect:
            sync_page();
            break;
        case SideEffect::None:
            break;
        default:
            log.warning("adau1467", "Unhandled side effect on control write");
            break;
    }
}

void Adau1467::sync_page() {
    Word page_bit = regs.read(adau_reg::SECONDPAGE_ENABLE).value_or(0) & 0x1;
    mem.set_page(page_bit ? Page::B : Page::A);
}

// =============================================================================
// Memory
// =============================================================================

Word Adau1467::read_memory(Address addr) {
    return read_memory(addr, PageOverride::CURRENT);
}

void Adau1467::write_memory(Address addr, Word value) {
    write_memory(addr, value, PageOverride::CURRENT);
}

Word Adau1467::read_memory(Address addr, PageOverride override) {
    return mem.read(addr, override);
}

void Adau1467::write_memory(Address addr, Word value, PageOverride override) {
    mem.write(addr, value, override);
    safeloader.on_memory_write(addr, value);
}

std::vector<Word> Adau1467::read_memory_block(Address start, size_t count, Page page) {
    log.debug("adau1467", "SaveMemory P" + page_name(page) + " address " + to_hex(start, 4)
              + " numWords " + std::to_string(count));
    return mem.read_block(start, count, force_page(page));
}

// =============================================================================
// Accessors
// =============================================================================

const RegisterBank& Adau1467::registers() const {
    return regs;
}

const MemoryBanks& Adau1467::memory() const {
    return mem;
}

const ProtocolDecoder& Adau1467::decoder() const {
    return proto;
}

const SafeloadEngine& Adau1467::safeload() const {
    return safeloader;
}

Page Adau1467::get_page() const {
    return mem.get_page();
}

const std::string& Adau1467::get_variant() const {
    return config.variant;
}

uint64_t Adau1467::get_control_read_count() const {
    return control_reads;
}

uint64_t Adau1467::get_control_write_count() const {
    return control_writes;
}

uint64_t Adau1467::get_reset_count() const {
    return resets;
}
