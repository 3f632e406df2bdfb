/**
 * address_space.hpp
 *
 * Address classification for the 16-bit sub-address space.
 * Maps a sub-address and page choice to a memory region and word index,
 * or flags it as a control register.
 */

#ifndef ADDRESS_SPACE_HPP
#define ADDRESS_SPACE_HPP

#include "common.hpp"

// Resolved memory cell
struct Location {
    Region region;
    Page page;
    Address index;      // Word index inside the region

    bool operator==(const Location& other) const {
        return region == other.region && page == other.page && index == other.index;
    }
};

class AddressSpace {
public:
    // Region windows (word addresses)
    static constexpr Address DM0_BASE     = 0x0000;
    static constexpr Address DM0_WORDS    = 0x5000;     // 20480
    static constexpr Address DM1_BASE     = 0x6000;
    static constexpr Address DM1_WORDS    = 0x5000;     // 20480
    static constexpr Address PROGRAM_BASE  = 0xC000;
    static constexpr Address PROGRAM_WORDS = 0x3000;    // 12288

    // Control registers are 16 bits wide, memory is 32
    static bool is_control(Address addr);

    // Bytes in one data phase for a transaction starting at addr
    static int word_bytes(Address addr);

    // Region lookup; nullopt for gaps and the control window
    static std::optional<Location> resolve(Address addr, PageOverride override, Page current);

    // Page actually used for an access
    static Page select_page(PageOverride override, Page current);

    static Address base(Region region);
    static Address words(Region region);
};

#endif // ADDRESS_SPACE_HPP
