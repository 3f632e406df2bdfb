/**
 * safeload.hpp
 *
 * Software safeload (ADAU1467 datasheet Rev.A Table 55).
 *
 * The host stages up to five parameter words at 0x6000..0x6004, writes the
 * target address to 0x6005 and then writes the word count to 0x6006
 * (page A) or 0x6007 (page B). The count write copies the staged words
 * to the target in one step.
 */

#ifndef SAFELOAD_HPP
#define SAFELOAD_HPP

#include "common.hpp"
#include "memory.hpp"
#include "log.hpp"

class SafeloadEngine {
public:
    static constexpr Address DATA_BASE     = 0x6000;    // Staged words
    static constexpr Address DATA_WORDS    = 5;
    static constexpr Address TARGET_ADDR   = 0x6005;    // Destination pointer
    static constexpr Address COUNT_LOWER   = 0x6006;    // Page A trigger
    static constexpr Address COUNT_UPPER   = 0x6007;    // Page B trigger

    SafeloadEngine(MemoryBanks& mem, Logger& log);

    // Called after every committed memory write; returns words copied
    size_t on_memory_write(Address addr, Word value);

    // Copy count staged words of the given page to its target pointer
    size_t commit(Page page, Word count);

    // Stats
    uint64_t get_commit_count() const;
    uint64_t get_word_count() const;

private:
    MemoryBanks& mem;
    Logger& log;
    uint64_t commits;
    uint64_t words_copied;
};

#endif // SAFELOAD_HPP
