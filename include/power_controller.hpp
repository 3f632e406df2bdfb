/**
 * power_controller.hpp
 *
 * STM32H7 PWR block (RM0433 for H74x/H75x, RM0468 for H72x/H73x).
 * Regulator status bits always report ready. PWR_CR1.DBP drives the
 * write access of an attached backup domain.
 */

#ifndef POWER_CONTROLLER_HPP
#define POWER_CONTROLLER_HPP

#include "common.hpp"
#include "log.hpp"
#include "peripheral.hpp"
#include "register_bank.hpp"

class PowerController {
public:
    static constexpr Word SIZE = 0x400;

    static constexpr Word CR1_DBP        = 1u << 8;
    static constexpr int  CR1_SVOS_SHIFT = 14;
    static constexpr Word CR1_SVOS_MASK  = 0x3u << CR1_SVOS_SHIFT;
    static constexpr int  VOS_SHIFT      = 14;
    static constexpr Word VOS_MASK       = 0x3u << VOS_SHIFT;

    enum class StopScaling { Reserved = 0, ScaleMode5 = 1, ScaleMode4 = 2, ScaleMode3 = 3 };

    // family is "H72", "H73", "H74" or "H75"
    PowerController(const std::string& family, Logger& log);

    void reset();

    // 32-bit MMIO access by byte offset
    Word read(Address offset);
    void write(Address offset, Word value);

    // Backup domain hook (may be null)
    void attach_backup_domain(BackupDomain* domain);
    bool backup_access_enabled() const;

    const RegisterBank& registers() const;
    const std::string& get_family() const;

private:
    std::string family;
    Logger& log;
    RegisterBank regs;
    BackupDomain* backup;

    void apply_side_effect(const WriteResult& result);
    void on_power_control1(Word previous, Word value);
    void on_regulator_scaling(Word value);
};

#endif // POWER_CONTROLLER_HPP
