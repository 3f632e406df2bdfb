/**
 * register_map.cpp
 *
 * Register tables for the ADAU1467 (ADAU1452 RevD Table 68 layout) and the
 * STM32H7 PWR block (RM0433/RM0468).
 *
 * Most ADAU registers are modelled as plain 16-bit storage with their
 * datasheet reset value. Status registers are read-only.
 */

#include "register_map.hpp"
#include <iterator>

namespace {

const RegisterSpec ADAU1467_TABLE[] = {
//   address reset   access              wmask   ready   effect                  name
    {0xF000, 0x0060, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PLL_CTRL0"},
    {0xF001, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PLL_CTRL1"},
    {0xF002, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PLL_CLK_SRC"},
    {0xF003, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PLL_ENABLE"},
    {0xF004, 0x0000, Access::ReadOnly,  0x0000, 0x0001, SideEffect::None,      "PLL_LOCK"},
    {0xF005, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MCLK_OUT"},
    {0xF006, 0x0001, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PLL_WATCHDOG"},
    {0xF020, 0x0006, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "CLK_GEN1_M"},
    {0xF021, 0x0001, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "CLK_GEN1_N"},
    {0xF022, 0x0009, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "CLK_GEN2_M"},
    {0xF023, 0x0001, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "CLK_GEN2_N"},
    {0xF024, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "CLK_GEN3_M"},
    {0xF025, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "CLK_GEN3_N"},
    {0xF026, 0x000E, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "CLK_GEN3_SRC"},
    {0xF027, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "CLK_GEN3_LOCK"},
    {0xF050, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "POWER_ENABLE0"},
    {0xF051, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "POWER_ENABLE1"},
    {0xF100, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_INPUT0"},
    {0xF101, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_INPUT1"},
    {0xF102, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_INPUT2"},
    {0xF103, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_INPUT3"},
    {0xF104, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_INPUT4"},
    {0xF105, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_INPUT5"},
    {0xF106, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_INPUT6"},
    {0xF107, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_INPUT7"},
    {0xF140, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_OUT_RATE0"},
    {0xF141, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_OUT_RATE1"},
    {0xF142, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_OUT_RATE2"},
    {0xF143, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_OUT_RATE3"},
    {0xF144, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_OUT_RATE4"},
    {0xF145, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_OUT_RATE5"},
    {0xF146, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_OUT_RATE6"},
    {0xF147, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_OUT_RATE7"},
    {0xF180, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE0"},
    {0xF181, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE1"},
    {0xF182, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE2"},
    {0xF183, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE3"},
    {0xF184, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE4"},
    {0xF185, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE5"},
    {0xF186, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE6"},
    {0xF187, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE7"},
    {0xF188, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE8"},
    {0xF189, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE9"},
    {0xF18A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE10"},
    {0xF18B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE11"},
    {0xF18C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE12"},
    {0xF18D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE13"},
    {0xF18E, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE14"},
    {0xF18F, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE15"},
    {0xF190, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE16"},
    {0xF191, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE17"},
    {0xF192, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE18"},
    {0xF193, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE19"},
    {0xF194, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE20"},
    {0xF195, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE21"},
    {0xF196, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE22"},
    {0xF197, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SOUT_SOURCE23"},
    {0xF1C0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIFTX_INPUT"},
    {0xF200, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_0_0"},
    {0xF201, 0x0002, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_0_1"},
    {0xF204, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_1_0"},
    {0xF205, 0x0002, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_1_1"},
    {0xF208, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_2_0"},
    {0xF209, 0x0002, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_2_1"},
    {0xF20C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_3_0"},
    {0xF20D, 0x0002, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_3_1"},
    {0xF210, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_4_0"},
    {0xF211, 0x0002, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_4_1"},
    {0xF214, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_5_0"},
    {0xF215, 0x0002, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_5_1"},
    {0xF218, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_6_0"},
    {0xF219, 0x0002, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_6_1"},
    {0xF21C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_7_0"},
    {0xF21D, 0x0002, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SERIAL_BYTE_7_1"},
    {0xF240, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_0_ROUTE"},
    {0xF241, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_1_ROUTE"},
    {0xF242, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_2_ROUTE"},
    {0xF243, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_3_ROUTE"},
    {0xF244, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_4_ROUTE"},
    {0xF245, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_5_ROUTE"},
    {0xF246, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_6_ROUTE"},
    {0xF247, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_7_ROUTE"},
    {0xF300, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN0"},
    {0xF301, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN1"},
    {0xF302, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN2"},
    {0xF303, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN3"},
    {0xF304, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN4"},
    {0xF305, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN5"},
    {0xF306, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN6"},
    {0xF307, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN7"},
    {0xF308, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN8"},
    {0xF309, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN9"},
    {0xF30A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN10"},
    {0xF30B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN11"},
    {0xF30C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN12"},
    {0xF30D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN13"},
    {0xF30E, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN14"},
    {0xF30F, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN15"},
    {0xF310, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN16"},
    {0xF311, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN17"},
    {0xF312, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN18"},
    {0xF313, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN19"},
    {0xF314, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN20"},
    {0xF315, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN21"},
    {0xF316, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN22"},
    {0xF317, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN23"},
    {0xF318, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN24"},
    {0xF319, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN25"},
    {0xF31A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN26"},
    {0xF31B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN27"},
    {0xF31C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN28"},
    {0xF31D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN29"},
    {0xF31E, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN30"},
    {0xF31F, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN31"},
    {0xF320, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN32"},
    {0xF321, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN33"},
    {0xF322, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN34"},
    {0xF323, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN35"},
    {0xF324, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN36"},
    {0xF325, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN37"},
    {0xF326, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN38"},
    {0xF327, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN39"},
    {0xF328, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN40"},
    {0xF329, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN41"},
    {0xF32A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN42"},
    {0xF32B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN43"},
    {0xF32C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN44"},
    {0xF32D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN45"},
    {0xF32E, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN46"},
    {0xF32F, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN47"},
    {0xF330, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN48"},
    {0xF331, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN49"},
    {0xF332, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN50"},
    {0xF333, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN51"},
    {0xF334, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN52"},
    {0xF335, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN53"},
    {0xF336, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN54"},
    {0xF337, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN55"},
    {0xF338, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN56"},
    {0xF339, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN57"},
    {0xF33A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN58"},
    {0xF33B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN59"},
    {0xF33C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN60"},
    {0xF33D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN61"},
    {0xF33E, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN62"},
    {0xF33F, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_IN63"},
    {0xF380, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT0"},
    {0xF381, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT1"},
    {0xF382, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT2"},
    {0xF383, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT3"},
    {0xF384, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT4"},
    {0xF385, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT5"},
    {0xF386, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT6"},
    {0xF387, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT7"},
    {0xF388, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT8"},
    {0xF389, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT9"},
    {0xF38A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT10"},
    {0xF38B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT11"},
    {0xF38C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT12"},
    {0xF38D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT13"},
    {0xF38E, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT14"},
    {0xF38F, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT15"},
    {0xF390, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT16"},
    {0xF391, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT17"},
    {0xF392, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT18"},
    {0xF393, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT19"},
    {0xF394, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT20"},
    {0xF395, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT21"},
    {0xF396, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT22"},
    {0xF397, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT23"},
    {0xF398, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT24"},
    {0xF399, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT25"},
    {0xF39A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT26"},
    {0xF39B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT27"},
    {0xF39C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT28"},
    {0xF39D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT29"},
    {0xF39E, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT30"},
    {0xF39F, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT31"},
    {0xF3A0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT32"},
    {0xF3A1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT33"},
    {0xF3A2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT34"},
    {0xF3A3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT35"},
    {0xF3A4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT36"},
    {0xF3A5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT37"},
    {0xF3A6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT38"},
    {0xF3A7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT39"},
    {0xF3A8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT40"},
    {0xF3A9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT41"},
    {0xF3AA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT42"},
    {0xF3AB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT43"},
    {0xF3AC, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT44"},
    {0xF3AD, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT45"},
    {0xF3AE, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT46"},
    {0xF3AF, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT47"},
    {0xF3B0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT48"},
    {0xF3B1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT49"},
    {0xF3B2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT50"},
    {0xF3B3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT51"},
    {0xF3B4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT52"},
    {0xF3B5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT53"},
    {0xF3B6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT54"},
    {0xF3B7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT55"},
    {0xF3B8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT56"},
    {0xF3B9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT57"},
    {0xF3BA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT58"},
    {0xF3BB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT59"},
    {0xF3BC, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT60"},
    {0xF3BD, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT61"},
    {0xF3BE, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT62"},
    {0xF3BF, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "FTDM_OUT63"},
    {0xF400, 0x0000, Access::ReadWrite, 0x0001, 0x0000, SideEffect::None,      "HIBERNATE"},
    {0xF401, 0x0002, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "START_PULSE"},
    {0xF402, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "START_CORE"},
    {0xF403, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "KILL_CORE"},
    {0xF404, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "START_ADDRESS"},
    {0xF405, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "CORE_STATUS"},
    {0xF421, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_CLEAR"},
    {0xF422, 0x0003, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_PARITY_MASK"},
    {0xF423, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_SOFTWARE_MASK"},
    {0xF424, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_WD_MASK"},
    {0xF425, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_STACK_MASK"},
    {0xF426, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_LOOP_MASK"},
    {0xF427, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "PANIC_FLAG"},
    {0xF428, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "PANIC_CODE"},
    {0xF432, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "EXECUTE_COUNT"},
    {0xF443, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "WATCHDOG_MAXCOUNT"},
    {0xF444, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "WATCHDOG_PRESCALE"},
    {0xF450, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BLOCKINT_EN"},
    {0xF451, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BLOCKINT_VALUE"},
    {0xF460, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "PROG_CNTR0"},
    {0xF461, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "PROG_CNTR1"},
    {0xF462, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PROG_CNTR_CLEAR"},
    {0xF463, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "PROG_CNTR_LENGTH0"},
    {0xF464, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "PROG_CNTR_LENGTH1"},
    {0xF465, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "PROG_CNTR_MAXLENGTH0"},
    {0xF466, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "PROG_CNTR_MAXLENGTH1"},
    {0xF467, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_PARITY_MASK1"},
    {0xF468, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_PARITY_MASK2"},
    {0xF469, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_PARITY_MASK3"},
    {0xF46A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_PARITY_MASK4"},
    {0xF46B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_PARITY_MASK5"},
    {0xF46C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_CODE1"},
    {0xF46D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_CODE2"},
    {0xF46E, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_CODE3"},
    {0xF46F, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_CODE4"},
    {0xF470, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "PANIC_CODE5"},
    {0xF510, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP0_MODE"},
    {0xF511, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP1_MODE"},
    {0xF512, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP2_MODE"},
    {0xF513, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP3_MODE"},
    {0xF514, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP4_MODE"},
    {0xF515, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP5_MODE"},
    {0xF516, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP6_MODE"},
    {0xF517, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP7_MODE"},
    {0xF518, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP8_MODE"},
    {0xF519, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP9_MODE"},
    {0xF51A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP10_MODE"},
    {0xF51B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP11_MODE"},
    {0xF51C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP12_MODE"},
    {0xF51D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP13_MODE"},
    {0xF520, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP0_WRITE"},
    {0xF521, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP1_WRITE"},
    {0xF522, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP2_WRITE"},
    {0xF523, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP3_WRITE"},
    {0xF524, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP4_WRITE"},
    {0xF525, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP5_WRITE"},
    {0xF526, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP6_WRITE"},
    {0xF527, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP7_WRITE"},
    {0xF528, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP8_WRITE"},
    {0xF529, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP9_WRITE"},
    {0xF52A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP10_WRITE"},
    {0xF52B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP11_WRITE"},
    {0xF52C, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP12_WRITE"},
    {0xF52D, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP13_WRITE"},
    {0xF530, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP0_READ"},
    {0xF531, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP1_READ"},
    {0xF532, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP2_READ"},
    {0xF533, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP3_READ"},
    {0xF534, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP4_READ"},
    {0xF535, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP5_READ"},
    {0xF536, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP6_READ"},
    {0xF537, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP7_READ"},
    {0xF538, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP8_READ"},
    {0xF539, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP9_READ"},
    {0xF53A, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP10_READ"},
    {0xF53B, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP11_READ"},
    {0xF53C, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP12_READ"},
    {0xF53D, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP13_READ"},
    {0xF560, 0x4000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "DMIC_CTRL0"},
    {0xF561, 0x4000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "DMIC_CTRL1"},
    {0xF580, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ASRC_LOCK"},
    {0xF581, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_MUTE"},
    {0xF582, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ASRC0_RATIO"},
    {0xF583, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ASRC1_RATIO"},
    {0xF584, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ASRC2_RATIO"},
    {0xF585, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ASRC3_RATIO"},
    {0xF586, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ASRC4_RATIO"},
    {0xF587, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ASRC5_RATIO"},
    {0xF588, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ASRC6_RATIO"},
    {0xF590, 0x07FF, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_RAMPMAX_OVR"},
    {0xF591, 0x07FF, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_RAMPMAX0"},
    {0xF592, 0x07FF, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_RAMPMAX1"},
    {0xF593, 0x07FF, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_RAMPMAX2"},
    {0xF594, 0x07FF, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_RAMPMAX3"},
    {0xF595, 0x07FF, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_RAMPMAX4"},
    {0xF596, 0x07FF, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_RAMPMAX5"},
    {0xF597, 0x07FF, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_RAMPMAX6"},
    {0xF598, 0x07FF, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "ASRC_RAMPMAX7"},
    {0xF5A0, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ADC_READ0"},
    {0xF5A1, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ADC_READ1"},
    {0xF5A2, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ADC_READ2"},
    {0xF5A3, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ADC_READ3"},
    {0xF5A4, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ADC_READ4"},
    {0xF5A5, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "ADC_READ5"},
    {0xF5C0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP14_MODE"},
    {0xF5C1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP15_MODE"},
    {0xF5C2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP16_MODE"},
    {0xF5C3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP17_MODE"},
    {0xF5C4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP18_MODE"},
    {0xF5C5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP19_MODE"},
    {0xF5C6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP20_MODE"},
    {0xF5C7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP21_MODE"},
    {0xF5C8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP22_MODE"},
    {0xF5C9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP23_MODE"},
    {0xF5CA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP24_MODE"},
    {0xF5CB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP25_MODE"},
    {0xF5D0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP14_WRITE"},
    {0xF5D1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP15_WRITE"},
    {0xF5D2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP16_WRITE"},
    {0xF5D3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP17_WRITE"},
    {0xF5D4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP18_WRITE"},
    {0xF5D5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP19_WRITE"},
    {0xF5D6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP20_WRITE"},
    {0xF5D7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP21_WRITE"},
    {0xF5D8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP22_WRITE"},
    {0xF5D9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP23_WRITE"},
    {0xF5DA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP24_WRITE"},
    {0xF5DB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP25_WRITE"},
    {0xF5E0, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP14_READ"},
    {0xF5E1, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP15_READ"},
    {0xF5E2, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP16_READ"},
    {0xF5E3, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP17_READ"},
    {0xF5E4, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP18_READ"},
    {0xF5E5, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP19_READ"},
    {0xF5E6, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP20_READ"},
    {0xF5E7, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP21_READ"},
    {0xF5E8, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP22_READ"},
    {0xF5E9, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP23_READ"},
    {0xF5EA, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP24_READ"},
    {0xF5EB, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "MP25_READ"},
    {0xF5F0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SECONDARY_I2C"},
    {0xF600, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_LOCK_DET"},
    {0xF601, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_RX_CTRL"},
    {0xF602, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_DECODE"},
    {0xF603, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_COMPRMODE"},
    {0xF604, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_RESTART"},
    {0xF605, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_LOSS_OF_LOCK"},
    {0xF606, 0x0001, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_RX_MCLKSPEED"},
    {0xF607, 0x0001, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_MCLKSPEED"},
    {0xF608, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_AUX_EN"},
    {0xF60F, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_AUXBIT_READY"},
    {0xF610, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_0"},
    {0xF611, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_1"},
    {0xF612, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_2"},
    {0xF613, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_3"},
    {0xF614, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_4"},
    {0xF615, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_5"},
    {0xF616, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_6"},
    {0xF617, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_7"},
    {0xF618, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_8"},
    {0xF619, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_9"},
    {0xF61A, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_10"},
    {0xF61B, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_LEFT_11"},
    {0xF620, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_0"},
    {0xF621, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_1"},
    {0xF622, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_2"},
    {0xF623, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_3"},
    {0xF624, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_4"},
    {0xF625, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_5"},
    {0xF626, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_6"},
    {0xF627, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_7"},
    {0xF628, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_8"},
    {0xF629, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_9"},
    {0xF62A, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_10"},
    {0xF62B, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_CS_RIGHT_11"},
    {0xF630, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_0"},
    {0xF631, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_1"},
    {0xF632, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_2"},
    {0xF633, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_3"},
    {0xF634, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_4"},
    {0xF635, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_5"},
    {0xF636, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_6"},
    {0xF637, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_7"},
    {0xF638, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_8"},
    {0xF639, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_9"},
    {0xF63A, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_10"},
    {0xF63B, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_LEFT_11"},
    {0xF640, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_0"},
    {0xF641, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_1"},
    {0xF642, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_2"},
    {0xF643, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_3"},
    {0xF644, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_4"},
    {0xF645, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_5"},
    {0xF646, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_6"},
    {0xF647, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_7"},
    {0xF648, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_8"},
    {0xF649, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_9"},
    {0xF64A, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_10"},
    {0xF64B, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_UD_RIGHT_11"},
    {0xF650, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_0"},
    {0xF651, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_1"},
    {0xF652, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_2"},
    {0xF653, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_3"},
    {0xF654, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_4"},
    {0xF655, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_5"},
    {0xF656, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_6"},
    {0xF657, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_7"},
    {0xF658, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_8"},
    {0xF659, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_9"},
    {0xF65A, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_10"},
    {0xF65B, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_LEFT_11"},
    {0xF660, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_0"},
    {0xF661, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_1"},
    {0xF662, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_2"},
    {0xF663, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_3"},
    {0xF664, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_4"},
    {0xF665, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_5"},
    {0xF666, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_6"},
    {0xF667, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_7"},
    {0xF668, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_8"},
    {0xF669, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_9"},
    {0xF66A, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_10"},
    {0xF66B, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_VB_RIGHT_11"},
    {0xF670, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_0"},
    {0xF671, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_1"},
    {0xF672, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_2"},
    {0xF673, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_3"},
    {0xF674, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_4"},
    {0xF675, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_5"},
    {0xF676, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_6"},
    {0xF677, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_7"},
    {0xF678, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_8"},
    {0xF679, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_9"},
    {0xF67A, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_10"},
    {0xF67B, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_LEFT_11"},
    {0xF680, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_0"},
    {0xF681, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_1"},
    {0xF682, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_2"},
    {0xF683, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_3"},
    {0xF684, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_4"},
    {0xF685, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_5"},
    {0xF686, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_6"},
    {0xF687, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_7"},
    {0xF688, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_8"},
    {0xF689, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_9"},
    {0xF68A, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_10"},
    {0xF68B, 0x0000, Access::ReadOnly,  0x0000, 0x0000, SideEffect::None,      "SPDIF_RX_PB_RIGHT_11"},
    {0xF690, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_EN"},
    {0xF691, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CTRL"},
    {0xF69F, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_AUXBIT_SOURCE"},
    {0xF6A0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_0"},
    {0xF6A1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_1"},
    {0xF6A2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_2"},
    {0xF6A3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_3"},
    {0xF6A4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_4"},
    {0xF6A5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_5"},
    {0xF6A6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_6"},
    {0xF6A7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_7"},
    {0xF6A8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_8"},
    {0xF6A9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_9"},
    {0xF6AA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_10"},
    {0xF6AB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_LEFT_11"},
    {0xF6B0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_0"},
    {0xF6B1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_1"},
    {0xF6B2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_2"},
    {0xF6B3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_3"},
    {0xF6B4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_4"},
    {0xF6B5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_5"},
    {0xF6B6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_6"},
    {0xF6B7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_7"},
    {0xF6B8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_8"},
    {0xF6B9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_9"},
    {0xF6BA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_10"},
    {0xF6BB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_CS_RIGHT_11"},
    {0xF6C0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_0"},
    {0xF6C1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_1"},
    {0xF6C2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_2"},
    {0xF6C3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_3"},
    {0xF6C4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_4"},
    {0xF6C5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_5"},
    {0xF6C6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_6"},
    {0xF6C7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_7"},
    {0xF6C8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_8"},
    {0xF6C9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_9"},
    {0xF6CA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_10"},
    {0xF6CB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_LEFT_11"},
    {0xF6D0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_0"},
    {0xF6D1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_1"},
    {0xF6D2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_2"},
    {0xF6D3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_3"},
    {0xF6D4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_4"},
    {0xF6D5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_5"},
    {0xF6D6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_6"},
    {0xF6D7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_7"},
    {0xF6D8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_8"},
    {0xF6D9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_9"},
    {0xF6DA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_10"},
    {0xF6DB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_UD_RIGHT_11"},
    {0xF6E0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_0"},
    {0xF6E1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_1"},
    {0xF6E2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_2"},
    {0xF6E3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_3"},
    {0xF6E4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_4"},
    {0xF6E5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_5"},
    {0xF6E6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_6"},
    {0xF6E7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_7"},
    {0xF6E8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_8"},
    {0xF6E9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_9"},
    {0xF6EA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_10"},
    {0xF6EB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_LEFT_11"},
    {0xF6F0, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_0"},
    {0xF6F1, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_1"},
    {0xF6F2, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_2"},
    {0xF6F3, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_3"},
    {0xF6F4, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_4"},
    {0xF6F5, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_5"},
    {0xF6F6, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_6"},
    {0xF6F7, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_7"},
    {0xF6F8, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_8"},
    {0xF6F9, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_9"},
    {0xF6FA, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_10"},
    {0xF6FB, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_VB_RIGHT_11"},
    {0xF700, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_0"},
    {0xF701, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_1"},
    {0xF702, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_2"},
    {0xF703, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_3"},
    {0xF704, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_4"},
    {0xF705, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_5"},
    {0xF706, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_6"},
    {0xF707, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_7"},
    {0xF708, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_8"},
    {0xF709, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_9"},
    {0xF70A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_10"},
    {0xF70B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_LEFT_11"},
    {0xF710, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_0"},
    {0xF711, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_1"},
    {0xF712, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_2"},
    {0xF713, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_3"},
    {0xF714, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_4"},
    {0xF715, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_5"},
    {0xF716, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_6"},
    {0xF717, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_7"},
    {0xF718, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_8"},
    {0xF719, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_9"},
    {0xF71A, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_10"},
    {0xF71B, 0x0000, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PB_RIGHT_11"},
    {0xF780, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BCLK_IN0_PIN"},
    {0xF781, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BCLK_IN1_PIN"},
    {0xF782, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BCLK_IN2_PIN"},
    {0xF783, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BCLK_IN3_PIN"},
    {0xF784, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BCLK_OUT0_PIN"},
    {0xF785, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BCLK_OUT1_PIN"},
    {0xF786, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BCLK_OUT2_PIN"},
    {0xF787, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "BCLK_OUT3_PIN"},
    {0xF788, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "LRCLK_IN0_PIN"},
    {0xF789, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "LRCLK_IN1_PIN"},
    {0xF78A, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "LRCLK_IN2_PIN"},
    {0xF78B, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "LRCLK_IN3_PIN"},
    {0xF78C, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "LRCLK_OUT0_PIN"},
    {0xF78D, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "LRCLK_OUT1_PIN"},
    {0xF78E, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "LRCLK_OUT2_PIN"},
    {0xF78F, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "LRCLK_OUT3_PIN"},
    {0xF790, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_IN0_PIN"},
    {0xF791, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_IN1_PIN"},
    {0xF792, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_IN2_PIN"},
    {0xF793, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_IN3_PIN"},
    {0xF794, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_OUT0_PIN"},
    {0xF795, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_OUT1_PIN"},
    {0xF796, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_OUT2_PIN"},
    {0xF797, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATA_OUT3_PIN"},
    {0xF798, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SPDIF_TX_PIN"},
    {0xF799, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SCLK_SCL_PIN"},
    {0xF79A, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MISO_SDA_PIN"},
    {0xF79B, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SS_PIN"},
    {0xF79C, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MOSI_ADDR1_PIN"},
    {0xF79D, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SCLK_SCL_M_PIN"},
    {0xF79E, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MISO_SDA_M_PIN"},
    {0xF79F, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SS_M_PIN"},
    {0xF7A0, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MOSI_M_PIN"},
    {0xF7A1, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP6_PIN"},
    {0xF7A2, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP7_PIN"},
    {0xF7A3, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "CLKOUT_PIN"},
    {0xF7A8, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP14_PIN"},
    {0xF7A9, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP15_PIN"},
    {0xF7B0, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATAIO0_PIN"},
    {0xF7B1, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATAIO1_PIN"},
    {0xF7B2, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATAIO2_PIN"},
    {0xF7B3, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATAIO3_PIN"},
    {0xF7B4, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATAIO4_PIN"},
    {0xF7B5, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATAIO5_PIN"},
    {0xF7B6, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATAIO6_PIN"},
    {0xF7B7, 0x0018, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "SDATAIO7_PIN"},
    {0xF7B8, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP24_PIN"},
    {0xF7B9, 0x0008, Access::ReadWrite, 0xFFFF, 0x0000, SideEffect::None,      "MP25_PIN"},
    {0xF890, 0x0001, Access::ReadWrite, 0x0001, 0x0000, SideEffect::None,      "SOFT_RESET"},
    {0xF899, 0x0000, Access::SideEffect, 0x0001, 0x0000, SideEffect::PageSelect, "SECONDPAGE_ENABLE"},
};

const RegisterSpec STM32H7_PWR_TABLE[] = {
//   offset  reset       access               wmask       ready       effect                        name
    {0x00, 0xF000C000, Access::SideEffect,  0x0007C3F1, 0x00000000, SideEffect::PowerControl1,    "PWR_CR1"},
    {0x04, 0x00004000, Access::ReadOnly,    0x00000000, 0x00002000, SideEffect::None,             "PWR_CSR1"},   // ACTVOSRDY
    {0x08, 0x00000000, Access::ReadWrite,   0x00000011, 0x00000000, SideEffect::None,             "PWR_CR2"},
    {0x0C, 0x00000046, Access::ReadWrite,   0x0300033F, 0x00000000, SideEffect::None,             "PWR_CR3"},
    {0x10, 0x00000000, Access::ReadWrite,   0x00000A07, 0x00000000, SideEffect::None,             "PWR_CPUCR"},
    {0x18, 0x00004000, Access::SideEffect,  0x0000C000, 0x00002000, SideEffect::RegulatorScaling, "PWR_D3CR"},   // VOSRDY
    {0x20, 0x00000000, Access::ReadWrite,   0x0000003F, 0x00000000, SideEffect::None,             "PWR_WKUPCR"},
    {0x24, 0x00000000, Access::ReadOnly,    0x00000000, 0x00000000, SideEffect::None,             "PWR_WKUPFR"},
    {0x28, 0x00000000, Access::ReadWrite,   0x0FFF3F3F, 0x00000000, SideEffect::None,             "PWR_WKUPEPR"},
};

} // namespace

const std::vector<RegisterSpec>& adau1467_registers() {
    static const std::vector<RegisterSpec> table(std::begin(ADAU1467_TABLE), std::end(ADAU1467_TABLE));
    return table;
}

const std::vector<RegisterSpec>& stm32h7_pwr_registers() {
    static const std::vector<RegisterSpec> table(std::begin(STM32H7_PWR_TABLE), std::end(STM32H7_PWR_TABLE));
    return table;
}
