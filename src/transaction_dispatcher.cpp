#include "transaction_dispatcher.hpp"
#include <cstdio>

// Returned for a write that completed with fewer bytes than the frame
// (matches PICO_ERROR_GENERIC)
static constexpr int SHORT_WRITE_ERROR = -1;

TransactionDispatcher::TransactionDispatcher(I2cTransport& bus, uint8_t address)
    : bus_(&bus), address_(address) {}

bool TransactionDispatcher::releases_bus(Command command) {
    return command != Command::WRITE_CONTROL;
}

DacError TransactionDispatcher::send(Command command, uint16_t payload, DacOperation op) {
    CommandFrame frame = CommandFrame::build(command, payload);
    bool release_bus = releases_bus(command);

    int result = bus_->write(address_, frame.data(), frame.size(), release_bus);

    if (trace_level_ >= TRACE::FRAME) {
        trace_frame(frame, release_bus, result);
    }

    if (result < 0) {
        return DacError::transport(op, result);
    }
    if (static_cast<size_t>(result) != frame.size()) {
        return DacError::transport(op, SHORT_WRITE_ERROR);
    }
    return DacError::success();
}

void TransactionDispatcher::trace_frame(const CommandFrame& frame, bool release_bus, int result) const {
    const uint8_t* b = frame.data();
    printf("[AD569X] TX addr=0x%02X [%02X %02X %02X] %s %s",
           address_, b[0], b[1], b[2],
           command_name(frame.command()),
           release_bus ? "stop" : "nostop");
    if (result < 0) {
        printf(" FAILED (%d)", result);
    }
    printf("\r\n");
}
