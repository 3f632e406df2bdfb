/**
 * memory.hpp
 *
 * Double-buffered DSP memory: DM0, DM1 and program memory, each with
 * an A and a B page of 32-bit words. Contents survive a device reset.
 */

#ifndef MEMORY_HPP
#define MEMORY_HPP

#include "common.hpp"
#include "address_space.hpp"
#include "log.hpp"

class MemoryBanks {
public:
    explicit MemoryBanks(Logger& log);

    // Zero every word on both pages (power-on only)
    void clear();

    // Page selector (mirrors SECONDPAGE_ENABLE.PAGE)
    void set_page(Page page);
    Page get_page() const;

    // Word access by sub-address; unmapped reads log an error and return 0,
    // unmapped writes are dropped
    Word read(Address addr, PageOverride override = PageOverride::CURRENT);
    void write(Address addr, Word value, PageOverride override = PageOverride::CURRENT);

    // Word access by resolved location
    Word read_at(const Location& loc) const;
    void write_at(const Location& loc, Word value);

    // Bulk operations
    std::vector<Word> read_block(Address start, size_t count, PageOverride override);
    void write_block(Address start, const std::vector<Word>& words,
                     PageOverride override = PageOverride::CURRENT);

    // Display
    void dump_words(std::ostream& out, Address start, size_t count,
                    PageOverride override = PageOverride::CURRENT) const;

    // Stats
    uint64_t get_read_count() const;
    uint64_t get_write_count() const;

private:
    Logger& log;
    Page page;
    std::array<std::vector<Word>, 3> page_a;
    std::array<std::vector<Word>, 3> page_b;
    uint64_t read_count;
    uint64_t write_count;

    std::vector<Word>& bank(Region region, Page p);
    const std::vector<Word>& bank(Region region, Page p) const;
};

#endif // MEMORY_HPP
