#include "ad569x_protocol.hpp"

namespace ControlRegisterCodec {

uint16_t encode(OperatingMode mode, bool reference_enabled, bool gain_double) {
    uint16_t word = 0x0000;
    word |= static_cast<uint16_t>(static_cast<uint16_t>(mode) << CONTROL_BITS::MODE_SHIFT) &
            CONTROL_BITS::MODE_MASK;
    if (!reference_enabled) word |= CONTROL_BITS::REF_DISABLE;
    if (gain_double)        word |= CONTROL_BITS::GAIN_2X;
    return word;
}

uint16_t encode(const ControlRegister& reg) {
    return encode(reg.mode, reg.reference_enabled, reg.gain_double);
}

ControlRegister decode(uint16_t word) {
    ControlRegister reg;
    reg.mode = static_cast<OperatingMode>(
        (word & CONTROL_BITS::MODE_MASK) >> CONTROL_BITS::MODE_SHIFT);
    reg.reference_enabled = (word & CONTROL_BITS::REF_DISABLE) == 0;
    reg.gain_double = (word & CONTROL_BITS::GAIN_2X) != 0;
    return reg;
}

}  // namespace ControlRegisterCodec

CommandFrame CommandFrame::build(Command command, uint16_t payload) {
    // Payload goes out MSB first
    CommandFrame frame;
    frame.bytes_[0] = static_cast<uint8_t>(command);
    frame.bytes_[1] = static_cast<uint8_t>((payload >> 8) & 0xFF);
    frame.bytes_[2] = static_cast<uint8_t>(payload & 0xFF);
    return frame;
}

bool is_valid_command(uint8_t raw) {
    switch (static_cast<Command>(raw)) {
        case Command::NOP:
        case Command::WRITE_INPUT:
        case Command::UPDATE_DAC:
        case Command::WRITE_DAC_AND_INPUT:
        case Command::WRITE_CONTROL:
            return true;
    }
    return false;
}

const char* command_name(Command command) {
    switch (command) {
        case Command::NOP:                 return "NOP";
        case Command::WRITE_INPUT:         return "WRITE_INPUT";
        case Command::UPDATE_DAC:          return "UPDATE_DAC";
        case Command::WRITE_DAC_AND_INPUT: return "WRITE_DAC_AND_INPUT";
        case Command::WRITE_CONTROL:       return "WRITE_CONTROL";
    }
    return "UNKNOWN";
}
