/**
 * test_dump.cpp
 *
 * Memory images and register snapshots.
 */

#include <gtest/gtest.h>
#include "dump.hpp"
#include "register_map.hpp"
#include <cstdio>

namespace {

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

class DumpTest : public ::testing::Test {
protected:
    std::ostringstream sink;
    Logger log{ sink, LogLevel::Warning };
    Adau1467 device{ log };
};

TEST_F(DumpTest, WordsAreWrittenBigEndian) {
    std::ostringstream out;
    write_words(out, { 0x0000002A, 0x11223344 });
    EXPECT_EQ(out.str(), std::string("\x00\x00\x00\x2A\x11\x22\x33\x44", 8));
}

TEST_F(DumpTest, SaveMemoryUsesRequestedPage) {
    device.write_memory(0x6000, 0xA1A2A3A4, PageOverride::FORCE_A);
    device.write_memory(0x6000, 0xB1B2B3B4, PageOverride::FORCE_B);
    device.write_memory(0x6001, 0x00000001, PageOverride::FORCE_B);

    std::string path = ::testing::TempDir() + "adau_mem_b.bin";
    save_memory(device, path, 0x6000, 2, Page::B);
    EXPECT_EQ(slurp(path), std::string("\xB1\xB2\xB3\xB4\x00\x00\x00\x01", 8));

    save_memory(device, path, 0x6000, 1, Page::A);
    EXPECT_EQ(slurp(path), std::string("\xA1\xA2\xA3\xA4", 4));
    std::remove(path.c_str());
}

TEST_F(DumpTest, SaveMemoryFailureCarriesPath) {
    const std::string path = "/nonexistent-adau-dir/mem.bin";
    try {
        save_memory(device, path, 0, 1, Page::A);
        FAIL() << "expected ExportError";
    } catch (const ExportError& e) {
        EXPECT_NE(std::string(e.what()).find(path), std::string::npos);
    }
}

TEST_F(DumpTest, RegistersAsJson) {
    std::string json = registers_to_json(device.registers());

    EXPECT_EQ(json.rfind("[{\"address\":61440,\"value\":96},", 0), 0u);   // PLL_CTRL0
    EXPECT_EQ(json.back(), ']');
    EXPECT_NE(json.find("{\"address\":63641,\"value\":0}"), std::string::npos);   // SECONDPAGE_ENABLE

    size_t entries = 0;
    for (size_t pos = json.find("\"address\""); pos != std::string::npos;
         pos = json.find("\"address\"", pos + 1)) {
        entries++;
    }
    EXPECT_EQ(entries, adau1467_registers().size());
}

TEST_F(DumpTest, SaveRegistersWritesJsonFile) {
    device.write_control(0xF001, 0x0102);
    std::string path = ::testing::TempDir() + "adau_regs.json";
    save_registers(device.registers(), path);

    std::string text = slurp(path);
    EXPECT_EQ(text, registers_to_json(device.registers()));
    EXPECT_NE(text.find("{\"address\":61441,\"value\":258}"), std::string::npos);
    std::remove(path.c_str());

    EXPECT_THROW(save_registers(device.registers(), "/nonexistent-adau-dir/r.json"), ExportError);
}
