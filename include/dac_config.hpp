#ifndef DAC_CONFIG_HPP
#define DAC_CONFIG_HPP

#include <cstdint>
#include "ad569x_protocol.hpp"

// AD569x driver configuration
namespace AD569X_CONFIG {
    // 7-bit bus addresses selected by the A0 strap
    constexpr uint8_t ADDRESS_A0_LOW  = 0x4C;
    constexpr uint8_t ADDRESS_A0_HIGH = 0x4E;
    constexpr uint8_t DEFAULT_ADDRESS = ADDRESS_A0_LOW;

    // Delay between bus bring-up and the first transaction
    constexpr uint32_t SETTLE_MS = 10;

    // Control register applied right after the construction-time reset:
    // normal mode, internal reference on, 1x gain
    constexpr ControlRegister DEFAULT_CONTROL = {OperatingMode::NORMAL, true, false};
}

// Frame trace verbosity
namespace TRACE {
    constexpr uint8_t NONE  = 0;
    constexpr uint8_t FRAME = 1;  // One line per dispatched frame

#ifdef AD569X_I2C_TRACE
    constexpr uint8_t DEFAULT_LEVEL = FRAME;
#else
    constexpr uint8_t DEFAULT_LEVEL = NONE;
#endif
}

#endif // DAC_CONFIG_HPP
