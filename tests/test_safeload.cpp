/**
 * test_safeload.cpp
 *
 * Safeload copy rules on the raw memory banks.
 */

#include <gtest/gtest.h>
#include "safeload.hpp"

class SafeloadTest : public ::testing::Test {
protected:
    std::ostringstream sink;
    Logger log{ sink, LogLevel::Warning };
    MemoryBanks mem{ log };
    SafeloadEngine safeload{ mem, log };

    void stage(Page page, const std::vector<Word>& words, Address target) {
        mem.write_block(SafeloadEngine::DATA_BASE, words, force_page(page));
        mem.write(SafeloadEngine::TARGET_ADDR, target, force_page(page));
    }
};

TEST_F(SafeloadTest, PageATriggerCopiesCountWords) {
    stage(Page::A, { 11, 22, 33, 44, 55 }, 0x0100);

    EXPECT_EQ(safeload.on_memory_write(SafeloadEngine::COUNT_LOWER, 3), 3u);

    EXPECT_EQ(mem.read_block(0x0100, 4, PageOverride::FORCE_A),
              (std::vector<Word>{ 11, 22, 33, 0 }));
    EXPECT_EQ(mem.read_block(0x0100, 3, PageOverride::FORCE_B),
              (std::vector<Word>{ 0, 0, 0 }));
    EXPECT_EQ(safeload.get_commit_count(), 1u);
    EXPECT_EQ(safeload.get_word_count(), 3u);
}

TEST_F(SafeloadTest, ZeroCountDoesNothing) {
    stage(Page::A, { 11, 22, 33 }, 0x0100);

    EXPECT_EQ(safeload.on_memory_write(SafeloadEngine::COUNT_LOWER, 0), 0u);
    EXPECT_EQ(mem.read(0x0100, PageOverride::FORCE_A), 0u);
    EXPECT_EQ(safeload.get_commit_count(), 0u);
}

TEST_F(SafeloadTest, PageBTriggerUsesPageBStagingAndPointer) {
    stage(Page::A, { 1, 2 }, 0x0200);
    stage(Page::B, { 7, 8 }, 0xC010);

    EXPECT_EQ(safeload.on_memory_write(SafeloadEngine::COUNT_UPPER, 2), 2u);

    EXPECT_EQ(mem.read_block(0xC010, 2, PageOverride::FORCE_B), (std::vector<Word>{ 7, 8 }));
    EXPECT_EQ(mem.read_block(0xC010, 2, PageOverride::FORCE_A), (std::vector<Word>{ 0, 0 }));
    EXPECT_EQ(mem.read_block(0x0200, 2, PageOverride::FORCE_A), (std::vector<Word>{ 0, 0 }));
}

TEST_F(SafeloadTest, CopyIgnoresCurrentPageSelector) {
    stage(Page::A, { 9 }, 0x0300);
    mem.set_page(Page::B);

    safeload.commit(Page::A, 1);
    EXPECT_EQ(mem.read(0x0300, PageOverride::FORCE_A), 9u);
    EXPECT_EQ(mem.read(0x0300, PageOverride::FORCE_B), 0u);
}

TEST_F(SafeloadTest, OtherAddressesDoNotTrigger) {
    stage(Page::A, { 5 }, 0x0100);
    EXPECT_EQ(safeload.on_memory_write(0x6005, 1), 0u);
    EXPECT_EQ(safeload.on_memory_write(0x0006, 1), 0u);
    EXPECT_EQ(mem.read(0x0100, PageOverride::FORCE_A), 0u);
}

TEST_F(SafeloadTest, UnmappedTargetIsRejected) {
    stage(Page::A, { 5 }, 0x5000);
    EXPECT_EQ(safeload.commit(Page::A, 1), 0u);
    EXPECT_EQ(log.count(LogLevel::Warning), 1u);
}

TEST_F(SafeloadTest, CopyStopsAtRegionEnd) {
    stage(Page::A, { 1, 2, 3, 4, 5 }, 0x4FFE);
    EXPECT_EQ(safeload.commit(Page::A, 5), 2u);
    EXPECT_EQ(mem.read(0x4FFE, PageOverride::FORCE_A), 1u);
    EXPECT_EQ(mem.read(0x4FFF, PageOverride::FORCE_A), 2u);
    EXPECT_EQ(log.count(LogLevel::Warning), 1u);
}
