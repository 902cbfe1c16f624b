#ifndef TRANSACTION_DISPATCHER_HPP
#define TRANSACTION_DISPATCHER_HPP

#include <cstdint>

#include "ad569x_protocol.hpp"
#include "dac_config.hpp"
#include "dac_error.hpp"
#include "i2c_transport.hpp"

// Sends one command frame per call to a fixed device address.
//
// Framing rule: WRITE_CONTROL goes out without a STOP condition (the bus
// transaction stays open); every other command ends with STOP. The chip
// requires this, so it is not configurable.
class TransactionDispatcher {
public:
    TransactionDispatcher(I2cTransport& bus, uint8_t address);

    // Build the frame for command/payload and write it once.
    // op tags the returned error with the logical operation in flight.
    DacError send(Command command, uint16_t payload, DacOperation op);

    // Whether command's frame ends with a STOP condition
    static bool releases_bus(Command command);

    uint8_t address() const { return address_; }

    // 0 = silent, 1 = log each frame
    void set_trace_level(uint8_t level) { trace_level_ = level; }
    uint8_t get_trace_level() const { return trace_level_; }

private:
    I2cTransport* bus_;
    uint8_t address_;
    uint8_t trace_level_ = TRACE::DEFAULT_LEVEL;

    void trace_frame(const CommandFrame& frame, bool release_bus, int result) const;
};

#endif // TRANSACTION_DISPATCHER_HPP
