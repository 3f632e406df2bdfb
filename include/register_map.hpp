/**
 * register_map.hpp
 *
 * Declarative register tables. Plain data only; behaviour lives in the
 * bank owners, keyed by RegisterSpec::effect.
 */

#ifndef REGISTER_MAP_HPP
#define REGISTER_MAP_HPP

#include "common.hpp"

namespace adau_reg {
    constexpr Address PLL_LOCK          = 0xF004;
    constexpr Address SOFT_RESET        = 0xF890;
    constexpr Address SECONDPAGE_ENABLE = 0xF899;
}

namespace pwr_reg {
    constexpr Address CR1     = 0x00;
    constexpr Address CSR1    = 0x04;
    constexpr Address CR2     = 0x08;
    constexpr Address CR3     = 0x0C;
    constexpr Address CPUCR   = 0x10;
    constexpr Address D3CR    = 0x18;
    constexpr Address WKUPCR  = 0x20;
    constexpr Address WKUPFR  = 0x24;
    constexpr Address WKUPEPR = 0x28;
}

// ADAU1467 control registers, 0xF000..0xF899, sorted by address
const std::vector<RegisterSpec>& adau1467_registers();

// STM32H7 power controller, byte offsets from the block base
const std::vector<RegisterSpec>& stm32h7_pwr_registers();

#endif // REGISTER_MAP_HPP
