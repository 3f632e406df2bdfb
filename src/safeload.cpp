/**
 * safeload.cpp
 *
 * Implementation of the safeload copy.
 */

#include "safeload.hpp"
#include "address_space.hpp"
#include <algorithm>

SafeloadEngine::SafeloadEngine(MemoryBanks& mem, Logger& log)
    : mem(mem), log(log), commits(0), words_copied(0) {}

size_t SafeloadEngine::on_memory_write(Address addr, Word value) {
    if (addr == COUNT_LOWER) return commit(Page::A, value);
    if (addr == COUNT_UPPER) return commit(Page::B, value);
    return 0;
}

size_t SafeloadEngine::commit(Page page, Word count) {
    if (count == 0) return 0;

    // Pointer, staged data and destination all live on the trigger's page
    PageOverride on_page = force_page(page);
    auto pointer = AddressSpace::resolve(TARGET_ADDR, on_page, page);
    auto staging = AddressSpace::resolve(DATA_BASE, on_page, page);

    Address target = static_cast<Address>(mem.read_at(*pointer));
    auto dest = AddressSpace::resolve(target, on_page, page);
    if (!dest) {
        log.warning("safeload", "P" + page_name(page) + ": target " + to_hex(target, 4)
                    + " is not in data or program memory");
        return 0;
    }

    // Clamp to what fits in both the staging and destination regions
    size_t limit = std::min<size_t>(AddressSpace::words(dest->region) - dest->index,
                                    AddressSpace::words(staging->region) - staging->index);
    size_t n = count;
    if (n > limit) {
        log.warning("safeload", "P" + page_name(page) + ": count " + std::to_string(count)
                    + " truncated to " + std::to_string(limit));
        n = limit;
    }

    log.debug("safeload", "P" + page_name(page) + ": address " + to_hex(target, 4)
              + " count " + std::to_string(n));

    for (size_t i = 0; i < n; i++) {
        Location from = *staging;
        from.index = static_cast<Address>(staging->index + i);
        Location to = *dest;
        to.index = static_cast<Address>(dest->index + i);

        Word value = mem.read_at(from);
        mem.write_at(to, value);
        log.noisy("safeload", "P" + page_name(page) + ": " + to_hex(static_cast<Address>(target + i), 4)
                  + " = " + to_hex(value));
    }

    commits++;
    words_copied += n;
    return n;
}

uint64_t SafeloadEngine::get_commit_count() const {
    return commits;
}

uint64_t SafeloadEngine::get_word_count() const {
    return words_copied;
}
