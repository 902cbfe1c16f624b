#ifndef DAC_DEVICE_HPP
#define DAC_DEVICE_HPP

#include <cstdint>
#include <optional>

#include "ad569x_protocol.hpp"
#include "dac_config.hpp"
#include "dac_error.hpp"
#include "i2c_transport.hpp"
#include "transaction_dispatcher.hpp"

// AD5691R/AD5692R/AD5693R single-channel I2C DAC: one instance per chip.
//
// Only obtainable through open(), which resets and configures the chip;
// a DacDevice value therefore always refers to a chip that accepted both.
// Holds no state besides the bus handle and address. Not thread-safe:
// callers sharing a device across cores must serialize calls.
class DacDevice {
public:
    // Reset the chip, then apply initial. On failure returns an empty
    // optional and sets error to INIT_FAILED with the failing step.
    static std::optional<DacDevice> open(I2cTransport& bus, DacError& error,
                                         uint8_t address = AD569X_CONFIG::DEFAULT_ADDRESS,
                                         const ControlRegister& initial = AD569X_CONFIG::DEFAULT_CONTROL);

    // Software reset: clears input, DAC and control registers, output to zero-scale
    DacError reset();

    // Write the control register (does not touch the DAC value).
    // Write-only: the chip's control register is never read back.
    DacError set_mode(OperatingMode mode, bool reference_enabled, bool gain_double);
    DacError set_mode(const ControlRegister& reg);

    // Load the input register; output unchanged until update_dac()
    DacError write_dac(uint16_t value);

    // Copy input register to DAC register
    DacError update_dac();

    // Load input register and update the output in one transaction
    DacError write_update_dac(uint16_t value);

    uint8_t address() const { return dispatcher_.address(); }

    // Frame trace verbosity (TRACE::NONE or TRACE::FRAME)
    void set_trace_level(uint8_t level) { dispatcher_.set_trace_level(level); }

private:
    DacDevice(I2cTransport& bus, uint8_t address);

    TransactionDispatcher dispatcher_;
};

#endif // DAC_DEVICE_HPP
