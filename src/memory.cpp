/**
 * memory.cpp
 *
 * Implementation of the paged DSP memory banks.
 * Each region is a flat word array per page, indexed from the region base.
 */

#include "memory.hpp"
#include <algorithm>

MemoryBanks::MemoryBanks(Logger& log)
    : log(log), page(Page::A), read_count(0), write_count(0) {
    static constexpr Region regions[] = { Region::DM0, Region::DM1, Region::PROGRAM };
    for (Region r : regions) {
        page_a[static_cast<size_t>(r)].assign(AddressSpace::words(r), 0);
        page_b[static_cast<size_t>(r)].assign(AddressSpace::words(r), 0);
    }
}

void MemoryBanks::clear() {
    for (auto& v : page_a) std::fill(v.begin(), v.end(), 0);
    for (auto& v : page_b) std::fill(v.begin(), v.end(), 0);
    read_count = 0;
    write_count = 0;
}

// =============================================================================
// Page Selection
// =============================================================================

void MemoryBanks::set_page(Page p) {
    if (p != page) {
        log.debug("memory", "SelectPage: page " + page_name(p));
    }
    page = p;
}

Page MemoryBanks::get_page() const {
    return page;
}

// =============================================================================
// Word Access
// =============================================================================

Word MemoryBanks::read(Address addr, PageOverride override) {
    auto loc = AddressSpace::resolve(addr, override, page);
    if (!loc) {
        log.error("memory", "INVALID mem addr " + to_hex(addr, 4));
        return 0;
    }
    read_count++;
    Word value = read_at(*loc);
    log.noisy("memory", "READ  mem addr " + to_hex(addr, 4) + " value " + to_hex(value));
    return value;
}

void MemoryBanks::write(Address addr, Word value, PageOverride override) {
    auto loc = AddressSpace::resolve(addr, override, page);
    if (!loc) return;

    write_count++;
    write_at(*loc, value);
    log.noisy("memory", "WRITE mem addr " + to_hex(addr, 4) + " value " + to_hex(value));
}

Word MemoryBanks::read_at(const Location& loc) const {
    return bank(loc.region, loc.page)[loc.index];
}

void MemoryBanks::write_at(const Location& loc, Word value) {
    bank(loc.region, loc.page)[loc.index] = value;
}

// =============================================================================
// Bulk Operations
// =============================================================================

std::vector<Word> MemoryBanks::read_block(Address start, size_t count, PageOverride override) {
    std::vector<Word> words;
    words.reserve(count);
    Address addr = start;
    for (size_t i = 0; i < count; i++) {
        words.push_back(read(addr, override));
        addr++;
    }
    return words;
}

void MemoryBanks::write_block(Address start, const std::vector<Word>& words, PageOverride override) {
    Address addr = start;
    for (Word w : words) {
        write(addr, w, override);
        addr++;
    }
}

// =============================================================================
// Display
// =============================================================================

void MemoryBanks::dump_words(std::ostream& out, Address start, size_t count, PageOverride override) const {
    Page p = AddressSpace::select_page(override, page);
    out << "Memory words [" << to_hex(start, 4) << "] page " << page_name(p) << ":\n";

    for (size_t i = 0; i < count; i += 4) {
        Address row = static_cast<Address>(start + i);
        out << "  " << to_hex(row, 4) << ":";
        for (size_t j = 0; j < 4 && (i + j) < count; j++) {
            auto loc = AddressSpace::resolve(static_cast<Address>(row + j), override, page);
            if (loc) {
                out << " " << to_hex(read_at(*loc));
            } else {
                out << " ..........";
            }
        }
        out << "\n";
    }
}

// =============================================================================
// Stats
// =============================================================================

uint64_t MemoryBanks::get_read_count() const {
    return read_count;
}

uint64_t MemoryBanks::get_write_count() const {
    return write_count;
}

// =============================================================================
// Helpers
// =============================================================================

std::vector<Word>& MemoryBanks::bank(Region region, Page p) {
    return (p == Page::A) ? page_a[static_cast<size_t>(region)]
                          : page_b[static_cast<size_t>(region)];
}

const std::vector<Word>& MemoryBanks::bank(Region region, Page p) const {
    return (p == Page::A) ? page_a[static_cast<size_t>(region)]
                          : page_b[static_cast<size_t>(region)];
}
