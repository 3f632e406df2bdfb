/**
 * test_adau1467.cpp
 *
 * Whole-device behaviour over the SPI link.
 */

#include <gtest/gtest.h>
#include "adau1467.hpp"
#include "register_map.hpp"
#include "spi_host.hpp"

class Adau1467Test : public ::testing::Test {
protected:
    std::ostringstream sink;
    Logger log{ sink, LogLevel::Warning };
    Adau1467 device{ log };
    SpiHost host{ device };

    void pulse_reset() {
        device.on_gpio(Adau1467::RESET_PIN, false);
        device.on_gpio(Adau1467::RESET_PIN, true);
    }
};

TEST_F(Adau1467Test, WriteThenReadMemoryWord) {
    host.transfer({ 0x00, 0x00, 0x10, 0x00, 0x00, 0x00, 0x2A });
    device.on_gpio(Adau1467::CHIP_SELECT_PIN, true);
    EXPECT_EQ(device.read_memory(0x0010), 0x2Au);

    std::vector<Byte> in = host.transfer({ 0x01, 0x00, 0x10, 0x00, 0x00, 0x00, 0x00 });
    host.deselect();
    EXPECT_EQ(std::vector<Byte>(in.begin() + 3, in.end()),
              (std::vector<Byte>{ 0x00, 0x00, 0x00, 0x2A }));
}

TEST_F(Adau1467Test, MemoryRoundTripAcrossRegions) {
    const std::pair<Address, Word> cases[] = {
        { 0x0000, 0xFFFFFFFF }, { 0x4FFF, 0x00C0FFEE },
        { 0x6123, 0x80000001 }, { 0xEFFF, 0x7FFFFFFF },
    };
    for (const auto& [addr, value] : cases) {
        host.write_word(addr, value);
        EXPECT_EQ(host.read_word(addr), value) << to_hex(addr, 4);
    }
}

TEST_F(Adau1467Test, ControlRegisterRoundTrip) {
    host.write_word(0xF001, 0x1234);
    EXPECT_EQ(host.read_word(0xF001), 0x1234u);
    EXPECT_EQ(device.read_control(0xF001), 0x1234);
}

TEST_F(Adau1467Test, ReadOnlyControlRegistersKeepTheirValue) {
    host.write_word(adau_reg::PLL_LOCK, 0x0000);
    EXPECT_EQ(host.read_word(adau_reg::PLL_LOCK), 0x0001u);

    host.write_word(0xF027, 0xFFFF);    // CLK_GEN3_LOCK
    EXPECT_EQ(host.read_word(0xF027), 0x0000u);
}

TEST_F(Adau1467Test, UnknownAddressesFollowErrorRules) {
    EXPECT_EQ(host.read_word(0xF010), 0u);
    EXPECT_EQ(log.count(LogLevel::Error), 1u);
    EXPECT_EQ(host.read_word(0x5000), 0u);
    EXPECT_EQ(log.count(LogLevel::Error), 2u);

    host.write_word(0xF010, 0x1111);
    host.write_word(0xB000, 0x2222);
    EXPECT_EQ(log.count(LogLevel::Error), 2u);
    EXPECT_EQ(log.count(LogLevel::Warning), 0u);
}

TEST_F(Adau1467Test, ResetRestoresRegistersButKeepsMemory) {
    host.write_word(0xF000, 0x0011);
    host.write_word(adau_reg::SECONDPAGE_ENABLE, 1);
    host.write_word(0x0042, 0xABCD);
    host.write_word(0xC000, 0x5555);
    ASSERT_EQ(device.get_page(), Page::B);

    pulse_reset();

    EXPECT_EQ(device.get_reset_count(), 1u);
    EXPECT_EQ(device.get_page(), Page::A);
    for (const RegisterSpec& s : adau1467_registers()) {
        EXPECT_EQ(device.read_control(s.address), static_cast<HalfWord>(s.reset | s.ready_mask))
            << s.name;
    }
    EXPECT_EQ(device.read_memory(0x0042, PageOverride::FORCE_B), 0xABCDu);
    EXPECT_EQ(device.read_memory(0xC000, PageOverride::FORCE_B), 0x5555u);
}

TEST_F(Adau1467Test, ResetFiresOnFallingEdgeOnly) {
    device.on_gpio(Adau1467::RESET_PIN, false);
    device.on_gpio(Adau1467::RESET_PIN, false);
    EXPECT_EQ(device.get_reset_count(), 1u);

    device.on_gpio(Adau1467::RESET_PIN, true);
    EXPECT_EQ(device.get_reset_count(), 1u);
    device.on_gpio(Adau1467::RESET_PIN, false);
    EXPECT_EQ(device.get_reset_count(), 2u);
}

TEST_F(Adau1467Test, ResetAbandonsTransaction) {
    host.transfer({ 0x00, 0x00, 0x10, 0x00, 0x00 });
    pulse_reset();
    EXPECT_EQ(device.decoder().get_state(), ProtocolDecoder::State::ChipAddress);
}

TEST_F(Adau1467Test, ChipSelectReleaseReturnsToIdle) {
    host.transfer({ 0x00, 0xF0 });
    device.on_gpio(Adau1467::CHIP_SELECT_PIN, false);
    EXPECT_EQ(device.decoder().get_state(), ProtocolDecoder::State::SubAddressLow);

    device.on_gpio(Adau1467::CHIP_SELECT_PIN, true);
    EXPECT_EQ(device.decoder().get_state(), ProtocolDecoder::State::ChipAddress);
}

TEST_F(Adau1467Test, PageSelectSwitchesUnqualifiedAccesses) {
    host.write_word(0x0010, 1);
    host.write_word(adau_reg::SECONDPAGE_ENABLE, 1);
    EXPECT_EQ(device.get_page(), Page::B);
    EXPECT_EQ(host.read_word(0x0010), 0u);

    host.write_word(0x0010, 2);
    EXPECT_EQ(device.read_memory_block(0x0010, 1, Page::A), (std::vector<Word>{ 1 }));
    EXPECT_EQ(device.read_memory_block(0x0010, 1, Page::B), (std::vector<Word>{ 2 }));

    host.write_word(adau_reg::SECONDPAGE_ENABLE, 0);
    EXPECT_EQ(host.read_word(0x0010), 1u);
    EXPECT_EQ(device.read_memory_block(0x0010, 1, Page::B), (std::vector<Word>{ 2 }));
}

TEST_F(Adau1467Test, SafeloadOverSpiCopiesStagedWords) {
    host.write_words(SafeloadEngine::DATA_BASE, { 0x100, 0x200, 0x300, 0x400, 0x500 });
    host.write_word(SafeloadEngine::TARGET_ADDR, 0xC020);
    host.write_word(SafeloadEngine::COUNT_LOWER, 3);

    EXPECT_EQ(host.read_words(0xC020, 4), (std::vector<Word>{ 0x100, 0x200, 0x300, 0 }));
    EXPECT_EQ(device.safeload().get_commit_count(), 1u);

    host.write_word(SafeloadEngine::COUNT_LOWER, 0);
    EXPECT_EQ(device.safeload().get_commit_count(), 1u);
}

TEST_F(Adau1467Test, RejectsUnknownVariant) {
    DeviceConfig config;
    config.variant = "ADAU9999";
    EXPECT_THROW(Adau1467 bad(log, config), std::invalid_argument);

    config.variant = "ADAU1463";
    Adau1467 small(log, config);
    EXPECT_EQ(small.get_variant(), "ADAU1463");
}

TEST_F(Adau1467Test, CountsControlTraffic) {
    host.write_words(0xF020, { 1, 2, 3 });
    host.read_word(0xF020);
    EXPECT_EQ(device.get_control_write_count(), 3u);
    EXPECT_EQ(device.get_control_read_count(), 1u);
    EXPECT_EQ(device.decoder().get_transaction_count(), 2u);
}
