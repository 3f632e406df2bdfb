/**
 * address_space.cpp
 *
 * Implementation of sub-address classification.
 */

#include "address_space.hpp"

bool AddressSpace::is_control(Address addr) {
    return addr >= CONTROL_BASE;
}

int AddressSpace::word_bytes(Address addr) {
    return is_control(addr) ? 2 : 4;
}

Page AddressSpace::select_page(PageOverride override, Page current) {
    switch (override) {
        case PageOverride::FORCE_A: return Page::A;
        case PageOverride::FORCE_B: return Page::B;
        case PageOverride::CURRENT: break;
    }
    return current;
}

std::optional<Location> AddressSpace::resolve(Address addr, PageOverride override, Page current) {
    Page page = select_page(override, current);

    // Windows are ascending and non-overlapping
    static constexpr Region regions[] = { Region::DM0, Region::DM1, Region::PROGRAM };
    for (Region r : regions) {
        Address lo = base(r);
        if (addr >= lo && addr - lo < words(r)) {
            return Location{ r, page, static_cast<Address>(addr - lo) };
        }
    }
    return std::nullopt;
}

Address AddressSpace::base(Region region) {
    switch (region) {
        case Region::DM0: return DM0_BASE;
        case Region::DM1: return DM1_BASE;
        case Region::PROGRAM: return PROGRAM_BASE;
    }
    return 0;
}

Address AddressSpace::words(Region region) {
    switch (region) {
        case Region::DM0: return DM0_WORDS;
        case Region::DM1: return DM1_WORDS;
        case Region::PROGRAM: return PROGRAM_WORDS;
    }
    return 0;
}
