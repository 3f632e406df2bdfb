/**
 * power_controller.cpp
 *
 * Implementation of the STM32H7 PWR block.
 */

#include "power_controller.hpp"
#include "register_map.hpp"

PowerController::PowerController(const std::string& family, Logger& log)
    : family(family), log(log), regs("stm32h7_pwr", stm32h7_pwr_registers(), 32, log),
      backup(nullptr) {
    if (family.empty()) {
        throw std::invalid_argument("stm32Family was empty");
    }
    if (family != "H72" && family != "H73" && family != "H74" && family != "H75") {
        throw std::invalid_argument("Unsupported STM32H7 family: " + family);
    }

    // No SMPS step-down on H74x/H75x
    if (family == "H74" || family == "H75") {
        regs.override_reset(pwr_reg::CR3, 0x00000006);
    }
    reset();
}

void PowerController::reset() {
    regs.reset();
    if (backup) backup->set_write_access(false);
}

// =============================================================================
// MMIO
// =============================================================================

Word PowerController::read(Address offset) {
    auto value = regs.read(offset);
    if (!value) {
        log.warning("pwr", "Unhandled read from offset " + to_hex(offset, 2));
        return 0;
    }
    return *value;
}

void PowerController::write(Address offset, Word value) {
    WriteResult result = regs.write(offset, value);
    if (!result.found) {
        log.warning("pwr", "Unhandled write to offset " + to_hex(offset, 2)
                    + " value " + to_hex(value));
        return;
    }
    apply_side_effect(result);
}

void PowerController::apply_side_effect(const WriteResult& result) {
    switch (result.effect) {
        case SideEffect::PowerControl1:
            on_power_control1(result.previous, result.value);
            break;
        case SideEffect::RegulatorScaling:
            on_regulator_scaling(result.value);
            break;
        case SideEffect::None:
            break;
        default:
            log.warning("pwr", "Unhandled side effect on register write");
            break;
    }
}

void PowerController::on_power_control1(Word previous, Word value) {
    // SVOS reserved encoding falls back to the reset mode
    if (((value & CR1_SVOS_MASK) >> CR1_SVOS_SHIFT) == static_cast<Word>(StopScaling::Reserved)) {
        value |= static_cast<Word>(StopScaling::ScaleMode3) << CR1_SVOS_SHIFT;
        regs.set_hardware(pwr_reg::CR1, value);
    }

    if ((previous ^ value) & CR1_DBP) {
        bool dbp = (value & CR1_DBP) != 0;
        log.debug("pwr", std::string("AccessRTC: dbp ") + (dbp ? "1" : "0"));
        if (backup) backup->set_write_access(dbp);
    }
}

void PowerController::on_regulator_scaling(Word value) {
    // ACTVOS follows VOS immediately
    Word csr1 = regs.read(pwr_reg::CSR1).value_or(0);
    csr1 = (csr1 & ~VOS_MASK) | (value & VOS_MASK);
    regs.set_hardware(pwr_reg::CSR1, csr1);
}

// =============================================================================
// Accessors
// =============================================================================

void PowerController::attach_backup_domain(BackupDomain* domain) {
    backup = domain;
    if (backup) backup->set_write_access(backup_access_enabled());
}

bool PowerController::backup_access_enabled() const {
    return (regs.read(pwr_reg::CR1).value_or(0) & CR1_DBP) != 0;
}

const RegisterBank& PowerController::registers() const {
    return regs;
}

const std::string& PowerController::get_family() const {
    return family;
}
