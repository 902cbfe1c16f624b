#include "dac_device.hpp"
#include <cstdio>

DacDevice::DacDevice(I2cTransport& bus, uint8_t address)
    : dispatcher_(bus, address) {}

std::optional<DacDevice> DacDevice::open(I2cTransport& bus, DacError& error,
                                         uint8_t address, const ControlRegister& initial) {
    DacDevice device(bus, address);

    // Reset to known registers, then configure; set_mode is skipped if reset fails
    DacError result = device.reset();
    if (result.ok()) {
        result = device.set_mode(initial);
    }

    if (!result.ok()) {
        error = DacError::init_failed(result);
        printf("[AD569X] 0x%02X %s\r\n", address, error.describe().c_str());
        return std::nullopt;
    }

    error = DacError::success();
    return device;
}

DacError DacDevice::reset() {
    return dispatcher_.send(Command::WRITE_CONTROL, RESET_WORD, DacOperation::RESET);
}

DacError DacDevice::set_mode(OperatingMode mode, bool reference_enabled, bool gain_double) {
    uint16_t word = ControlRegisterCodec::encode(mode, reference_enabled, gain_double);
    return dispatcher_.send(Command::WRITE_CONTROL, word, DacOperation::SET_MODE);
}

DacError DacDevice::set_mode(const ControlRegister& reg) {
    return set_mode(reg.mode, reg.reference_enabled, reg.gain_double);
}

DacError DacDevice::write_dac(uint16_t value) {
    return dispatcher_.send(Command::WRITE_INPUT, value, DacOperation::WRITE_DAC);
}

DacError DacDevice::update_dac() {
    return dispatcher_.send(Command::UPDATE_DAC, 0x0000, DacOperation::UPDATE_DAC);
}

DacError DacDevice::write_update_dac(uint16_t value) {
    return dispatcher_.send(Command::WRITE_DAC_AND_INPUT, value, DacOperation::WRITE_UPDATE_DAC);
}
