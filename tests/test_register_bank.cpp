/**
 * test_register_bank.cpp
 *
 * Table-driven register file, exercised with the ADAU1467 table.
 */

#include <gtest/gtest.h>
#include "register_bank.hpp"
#include "register_map.hpp"

class RegisterBankTest : public ::testing::Test {
protected:
    std::ostringstream sink;
    Logger log{ sink, LogLevel::Warning };
    RegisterBank regs{ "adau1467", adau1467_registers(), 16, log };
};

TEST_F(RegisterBankTest, HoldsFullTableWithResetValues) {
    EXPECT_EQ(regs.size(), 606u);
    EXPECT_EQ(regs.read(0xF000), 0x0060u);     // PLL_CTRL0
    EXPECT_EQ(regs.read(0xF006), 0x0001u);     // PLL_WATCHDOG
    EXPECT_EQ(regs.read(0xF020), 0x0006u);     // CLK_GEN1_M
    EXPECT_EQ(regs.read(adau_reg::SOFT_RESET), 0x0001u);
    EXPECT_EQ(regs.read(adau_reg::SECONDPAGE_ENABLE), 0x0000u);
}

TEST_F(RegisterBankTest, ReadWriteRegisterStoresValue) {
    WriteResult r = regs.write(0xF001, 0xBEEF);
    EXPECT_TRUE(r.found);
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.effect, SideEffect::None);
    EXPECT_EQ(regs.read(0xF001), 0xBEEFu);
}

TEST_F(RegisterBankTest, ReadOnlyRegisterIgnoresWrites) {
    WriteResult r = regs.write(0xF027, 0x1234);     // CLK_GEN3_LOCK
    EXPECT_TRUE(r.found);
    EXPECT_FALSE(r.changed);
    EXPECT_EQ(regs.read(0xF027), 0x0000u);
}

TEST_F(RegisterBankTest, PllLockAlwaysReadsReady) {
    EXPECT_EQ(regs.read(adau_reg::PLL_LOCK), 0x0001u);
    regs.write(adau_reg::PLL_LOCK, 0x0000);
    EXPECT_EQ(regs.read(adau_reg::PLL_LOCK), 0x0001u);
    regs.reset();
    EXPECT_EQ(regs.read(adau_reg::PLL_LOCK), 0x0001u);
}

TEST_F(RegisterBankTest, ReservedBitsAreMaskedOff) {
    regs.write(adau_reg::SOFT_RESET, 0xFFFE);
    EXPECT_EQ(regs.read(adau_reg::SOFT_RESET), 0x0000u);
    regs.write(adau_reg::SOFT_RESET, 0xFFFF);
    EXPECT_EQ(regs.read(adau_reg::SOFT_RESET), 0x0001u);
}

TEST_F(RegisterBankTest, SideEffectReportedOnlyOnChange) {
    WriteResult first = regs.write(adau_reg::SECONDPAGE_ENABLE, 1);
    EXPECT_EQ(first.effect, SideEffect::PageSelect);
    EXPECT_EQ(first.previous, 0u);
    EXPECT_EQ(first.value, 1u);

    WriteResult again = regs.write(adau_reg::SECONDPAGE_ENABLE, 1);
    EXPECT_FALSE(again.changed);
    EXPECT_EQ(again.effect, SideEffect::None);
}

TEST_F(RegisterBankTest, UnknownAddressIsNotFound) {
    EXPECT_FALSE(regs.read(0xF010).has_value());
    EXPECT_FALSE(regs.write(0xF010, 1).found);
    EXPECT_FALSE(regs.contains(0xF010));
    EXPECT_EQ(regs.spec(0xF010), nullptr);
}

TEST_F(RegisterBankTest, ResetRestoresEveryDefault) {
    for (Address addr : regs.addresses()) {
        regs.write(addr, 0xA5A5);
    }
    regs.reset();
    for (const RegisterSpec& s : adau1467_registers()) {
        EXPECT_EQ(*regs.read(s.address), (s.reset | s.ready_mask) & 0xFFFF) << s.name;
    }
}

TEST_F(RegisterBankTest, HardwareUpdateAndResetOverride) {
    EXPECT_TRUE(regs.set_hardware(0xF027, 0x0001));
    EXPECT_EQ(regs.read(0xF027), 0x0001u);

    EXPECT_TRUE(regs.override_reset(0xF001, 0x0042));
    regs.reset();
    EXPECT_EQ(regs.read(0xF001), 0x0042u);
    EXPECT_EQ(regs.read(0xF027), 0x0000u);

    EXPECT_FALSE(regs.set_hardware(0xF010, 1));
}

TEST_F(RegisterBankTest, FindsRegistersByName) {
    EXPECT_EQ(regs.find("PLL_CTRL0"), Address(0xF000));
    EXPECT_EQ(regs.find("secondpage_enable"), adau_reg::SECONDPAGE_ENABLE);
    EXPECT_FALSE(regs.find("NO_SUCH_REG").has_value());
}

TEST_F(RegisterBankTest, DumpListsRegisters) {
    std::ostringstream out;
    regs.dump_reg(out, 0xF000);
    EXPECT_EQ(out.str(), "PLL_CTRL0 @ 0xF000 = 0x0060 (reset 0x0060)\n");

    std::ostringstream all;
    regs.dump(all);
    EXPECT_NE(all.str().find("SECONDPAGE_ENABLE"), std::string::npos);
}

TEST(RegisterBankConstruction, RejectsDuplicatesAndBadWidth) {
    Logger log(std::cerr, LogLevel::Error);
    std::vector<RegisterSpec> dup = {
        { 0x10, 0, Access::ReadWrite, 0xFF, 0, SideEffect::None, "A" },
        { 0x10, 0, Access::ReadWrite, 0xFF, 0, SideEffect::None, "B" },
    };
    EXPECT_THROW(RegisterBank("dup", dup, 16, log), std::invalid_argument);
    EXPECT_THROW(RegisterBank("odd", adau1467_registers(), 8, log), std::invalid_argument);
}
