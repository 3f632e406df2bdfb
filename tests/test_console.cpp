/**
 * test_console.cpp
 *
 * Command front end driven through execute_command().
 */

#include <gtest/gtest.h>
#include "console.hpp"
#include "register_map.hpp"
#include <cstdio>

class ConsoleTest : public ::testing::Test {
protected:
    std::ostringstream sink;
    std::ostringstream out;
    Logger log{ sink, LogLevel::Warning };
    Adau1467 device{ log };
    Console console{ device, log, out };

    std::string run(const std::string& line) {
        out.str("");
        EXPECT_TRUE(console.execute_command(line));
        return out.str();
    }

    bool contains(const std::string& text, const std::string& needle) {
        return text.find(needle) != std::string::npos;
    }
};

TEST_F(ConsoleTest, WriteThenReadMemory) {
    EXPECT_TRUE(contains(run("write 0xC000 0x12345678 0x9ABCDEF0"), "Wrote 2 word(s) at 0xC000"));
    EXPECT_EQ(device.read_memory(0xC001), 0x9ABCDEF0u);

    std::string text = run("read 0xC000 2");
    EXPECT_TRUE(contains(text, "0xC000: 0x12345678"));
    EXPECT_TRUE(contains(text, "0xC001: 0x9ABCDEF0"));
}

TEST_F(ConsoleTest, ControlRegistersByName) {
    EXPECT_TRUE(contains(run("read PLL_CTRL0"), "0xF000: 0x0060"));

    run("write PLL_CTRL1 0x0102");
    EXPECT_EQ(device.read_control(0xF001), 0x0102);
    EXPECT_EQ(run("reg pll_ctrl1"), "PLL_CTRL1 @ 0xF001 = 0x0102 (reset 0x0000)\n");
    EXPECT_TRUE(contains(run("reg 0xF004"), "PLL_LOCK @ 0xF004 = 0x0001"));
    EXPECT_TRUE(contains(run("reg NOT_A_REGISTER"), "Unknown register"));
}

TEST_F(ConsoleTest, RejectsBadArguments) {
    EXPECT_TRUE(contains(run("write 0xF000 0x10000"), "does not fit a 16-bit register"));
    EXPECT_EQ(device.read_control(0xF000), 0x0060);

    EXPECT_TRUE(contains(run("read 0x10000"), "Invalid address"));
    EXPECT_TRUE(contains(run("write 0xC000 zz"), "Invalid number"));
    EXPECT_TRUE(contains(run("tx 0x100"), "Not a byte"));
    EXPECT_TRUE(contains(run("mem 0 4 c"), "Invalid page"));
    EXPECT_TRUE(contains(run("frobnicate"), "Unknown command: frobnicate"));
    EXPECT_TRUE(contains(run("write 0xC000"), "Usage"));
}

TEST_F(ConsoleTest, RawBytesAndChipSelect) {
    EXPECT_EQ(run("tx 0x01 0xF0 0x00 0x00 0x00"), "RX: 00 00 00 00 60\n");
    EXPECT_EQ(device.decoder().get_state(), ProtocolDecoder::State::Data0);

    run("cs");
    EXPECT_EQ(device.decoder().get_state(), ProtocolDecoder::State::ChipAddress);
}

TEST_F(ConsoleTest, PageSelection) {
    EXPECT_EQ(run("page"), "Page: A\n");
    EXPECT_EQ(run("page b"), "Page: B\n");
    EXPECT_EQ(device.get_page(), Page::B);

    run("write 0x0000 0x0B");
    EXPECT_EQ(device.read_memory(0x0000, PageOverride::FORCE_B), 0x0Bu);
    EXPECT_EQ(device.read_memory(0x0000, PageOverride::FORCE_A), 0u);
    EXPECT_TRUE(contains(run("mem 0 1 a"), "0x0000: 0x00000000"));
    EXPECT_TRUE(contains(run("mem 0 1"), "0x0000: 0x0000000B"));

    run("page a");
    EXPECT_EQ(device.get_page(), Page::A);
}

TEST_F(ConsoleTest, SafeloadCommitsToCurrentPage) {
    EXPECT_TRUE(contains(run("safeload 0x0010 1 2 3"), "Safeload PA: 3 word(s) to 0x0010"));
    EXPECT_EQ(device.read_memory(0x0010), 1u);
    EXPECT_EQ(device.read_memory(0x0012), 3u);
    EXPECT_EQ(device.safeload().get_commit_count(), 1u);

    run("page b");
    run("safeload 0x0010 7");
    EXPECT_EQ(device.read_memory(0x0010, PageOverride::FORCE_B), 7u);
    EXPECT_EQ(device.read_memory(0x0010, PageOverride::FORCE_A), 1u);

    EXPECT_TRUE(contains(run("safeload 0 1 2 3 4 5 6"), "At most 5 words"));
    EXPECT_EQ(device.safeload().get_commit_count(), 2u);
}

TEST_F(ConsoleTest, ResetRestoresRegistersAndKeepsMemory) {
    run("write 0xC000 0x55");
    run("write PLL_CTRL1 0x0102");
    run("page b");

    EXPECT_EQ(run("reset"), "Reset complete\n");
    EXPECT_EQ(device.read_control(0xF001), 0x0000);
    EXPECT_EQ(device.get_page(), Page::A);
    EXPECT_EQ(device.read_memory(0xC000), 0x55u);
    EXPECT_EQ(device.get_reset_count(), 1u);
}

TEST_F(ConsoleTest, LogLevel) {
    EXPECT_EQ(run("loglevel"), "Log level: WARNING\n");
    EXPECT_EQ(run("loglevel debug"), "Log level: DEBUG\n");
    EXPECT_EQ(log.get_threshold(), LogLevel::Debug);
    EXPECT_TRUE(contains(run("loglevel loud"), "Unknown log level"));
}

TEST_F(ConsoleTest, SourceStopsAtQuit) {
    std::string path = ::testing::TempDir() + "adau_console_script.txt";
    {
        std::ofstream script(path);
        script << "# setup\n"
               << "write 0xC000 0x55   # program word\n"
               << "\n"
               << "quit\n"
               << "write 0xC001 0x66\n";
    }

    EXPECT_FALSE(console.source(path));
    EXPECT_EQ(device.read_memory(0xC000), 0x55u);
    EXPECT_EQ(device.read_memory(0xC001), 0u);
    std::remove(path.c_str());

    EXPECT_FALSE(console.source("/nonexistent-adau-dir/script.txt"));
    EXPECT_TRUE(contains(out.str(), "Cannot open script"));
}

TEST_F(ConsoleTest, QuitEndsLoop) {
    EXPECT_FALSE(console.execute_command("quit"));

    std::istringstream in("write 0xC000 1\nexit\nwrite 0xC000 2\n");
    Console second(device, log, out);
    second.run(in);
    EXPECT_EQ(device.read_memory(0xC000), 1u);
    EXPECT_TRUE(contains(out.str(), "Goodbye!"));
}
