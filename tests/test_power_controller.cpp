/**
 * test_power_controller.cpp
 *
 * STM32H7 PWR register behaviour and the backup-domain hook.
 */

#include <gtest/gtest.h>
#include "power_controller.hpp"
#include "register_map.hpp"

namespace {

struct FakeBackupDomain : BackupDomain {
    bool writable = false;
    int changes = 0;

    void set_write_access(bool enabled) override {
        writable = enabled;
        changes++;
    }
};

} // namespace

class PowerControllerTest : public ::testing::Test {
protected:
    std::ostringstream sink;
    Logger log{ sink, LogLevel::Warning };
    PowerController pwr{ "H72", log };
    FakeBackupDomain backup;
};

TEST_F(PowerControllerTest, ResetValues) {
    EXPECT_EQ(pwr.read(pwr_reg::CR1), 0xF000C000u);
    EXPECT_EQ(pwr.read(pwr_reg::CR3), 0x00000046u);
    EXPECT_EQ(pwr.read(pwr_reg::CR2), 0u);
}

TEST_F(PowerControllerTest, FamilyControlsCr3Reset) {
    PowerController h74("H74", log);
    EXPECT_EQ(h74.read(pwr_reg::CR3), 0x00000006u);
    EXPECT_EQ(h74.get_family(), "H74");
}

TEST_F(PowerControllerTest, RejectsMissingOrUnknownFamily) {
    EXPECT_THROW(PowerController bad("", log), std::invalid_argument);
    EXPECT_THROW(PowerController bad("F4", log), std::invalid_argument);
}

TEST_F(PowerControllerTest, RegulatorReadyFlagsAlwaysSet) {
    EXPECT_NE(pwr.read(pwr_reg::CSR1) & 0x2000, 0u);
    EXPECT_NE(pwr.read(pwr_reg::D3CR) & 0x2000, 0u);

    pwr.write(pwr_reg::CSR1, 0);
    pwr.write(pwr_reg::D3CR, 0);
    EXPECT_NE(pwr.read(pwr_reg::CSR1) & 0x2000, 0u);
    EXPECT_NE(pwr.read(pwr_reg::D3CR) & 0x2000, 0u);
}

TEST_F(PowerControllerTest, ActiveScalingFollowsRequestedScaling) {
    pwr.write(pwr_reg::D3CR, 0x0000C000);
    EXPECT_EQ(pwr.read(pwr_reg::D3CR), 0x0000E000u);
    EXPECT_EQ(pwr.read(pwr_reg::CSR1) & PowerController::VOS_MASK, 0x0000C000u);

    pwr.write(pwr_reg::D3CR, 0x00008000);
    EXPECT_EQ(pwr.read(pwr_reg::CSR1) & PowerController::VOS_MASK, 0x00008000u);
}

TEST_F(PowerControllerTest, DbpDrivesBackupDomainAccess) {
    pwr.attach_backup_domain(&backup);
    EXPECT_FALSE(backup.writable);

    pwr.write(pwr_reg::CR1, 0xF000C000 | PowerController::CR1_DBP);
    EXPECT_TRUE(pwr.backup_access_enabled());
    EXPECT_TRUE(backup.writable);
    int changes = backup.changes;

    // Same DBP value again: no notification
    pwr.write(pwr_reg::CR1, 0xF000C001 | PowerController::CR1_DBP);
    EXPECT_EQ(backup.changes, changes);

    pwr.write(pwr_reg::CR1, 0xF000C000);
    EXPECT_FALSE(backup.writable);

    pwr.write(pwr_reg::CR1, 0xF000C000 | PowerController::CR1_DBP);
    pwr.reset();
    EXPECT_FALSE(backup.writable);
    EXPECT_FALSE(pwr.backup_access_enabled());
}

TEST_F(PowerControllerTest, ReservedStopScalingFallsBackToMode3) {
    pwr.write(pwr_reg::CR1, 0xF0004000);
    EXPECT_EQ(pwr.read(pwr_reg::CR1), 0xF0004000u);

    pwr.write(pwr_reg::CR1, 0xF0000000);
    EXPECT_EQ(pwr.read(pwr_reg::CR1) & PowerController::CR1_SVOS_MASK, 0x0000C000u);
}

TEST_F(PowerControllerTest, ReservedBitsIgnoreWrites) {
    pwr.write(pwr_reg::CR2, 0xFFFFFFFF);
    EXPECT_EQ(pwr.read(pwr_reg::CR2), 0x00000011u);

    pwr.write(pwr_reg::WKUPFR, 0x3F);
    EXPECT_EQ(pwr.read(pwr_reg::WKUPFR), 0u);
}

TEST_F(PowerControllerTest, UnknownOffsetsWarn) {
    EXPECT_EQ(pwr.read(0x14), 0u);
    pwr.write(0x30, 1);
    EXPECT_EQ(log.count(LogLevel::Warning), 2u);
}
