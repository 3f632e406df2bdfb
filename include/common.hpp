/**
 * common.hpp
 *
 * Shared types, constants, and utility functions used throughout the simulator.
 */

#ifndef COMMON_HPP
#define COMMON_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <map>
#include <array>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <stdexcept>
#include <optional>
#include <limits>

// =============================================================================
// Basic Types
// =============================================================================

using Word = uint32_t;          // 32-bit memory word / MMIO register
using HalfWord = uint16_t;      // 16-bit control register
using Byte = uint8_t;           // One SPI byte
using Address = uint16_t;       // 16-bit sub-address

// First control register; everything below is 32-bit memory
constexpr Address CONTROL_BASE = 0xF000;

// =============================================================================
// Memory Layout
// =============================================================================

enum class Region {
    DM0,        // Data memory 0
    DM1,        // Data memory 1
    PROGRAM     // Program memory
};

enum class Page {
    A,          // Lower page (SECONDPAGE_ENABLE.PAGE == 0)
    B           // Upper page (SECONDPAGE_ENABLE.PAGE == 1)
};

// How an access picks its page
enum class PageOverride {
    CURRENT,    // Follow the page selector register
    FORCE_A,
    FORCE_B
};

// =============================================================================
// Register Description
// =============================================================================

enum class Access {
    ReadWrite,
    ReadOnly,
    SideEffect      // Read-write, owner is notified after the value changes
};

enum class SideEffect {
    None,
    PageSelect,             // ADAU SECONDPAGE_ENABLE
    PowerControl1,          // STM32H7 PWR_CR1 (DBP backup-domain access, SVOS)
    RegulatorScaling        // STM32H7 PWR_D3CR.VOS
};

struct RegisterSpec {
    Address address;
    Word reset;
    Access access;
    Word write_mask;        // Bits a bus write may change
    Word ready_mask;        // Bits that always read back as 1
    SideEffect effect;
    const char* name;
};

// =============================================================================
// Utility Functions
// =============================================================================

// Format as hex string
inline std::string to_hex(Word value, int width = 8) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0') << std::setw(width) << value;
    return oss.str();
}

inline std::string region_name(Region region) {
    switch (region) {
        case Region::DM0: return "DM0";
        case Region::DM1: return "DM1";
        case Region::PROGRAM: return "PROGRAM";
    }
    return "?";
}

inline std::string page_name(Page page) {
    return (page == Page::A) ? "A" : "B";
}

inline PageOverride force_page(Page page) {
    return (page == Page::A) ? PageOverride::FORCE_A : PageOverride::FORCE_B;
}

// Parse "0x..." hex or decimal; nullopt when malformed or out of range
inline std::optional<Word> parse_number(const std::string& str) {
    if (str.empty()) return std::nullopt;
    try {
        size_t used = 0;
        unsigned long value;
        if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
            value = std::stoul(str.substr(2), &used, 16);
            used += 2;
        } else {
            value = std::stoul(str, &used, 10);
        }
        if (used != str.size() || value > std::numeric_limits<Word>::max()) {
            return std::nullopt;
        }
        return static_cast<Word>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

#endif // COMMON_HPP
