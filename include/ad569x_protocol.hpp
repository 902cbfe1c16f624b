#ifndef AD569X_PROTOCOL_HPP
#define AD569X_PROTOCOL_HPP

#include <array>
#include <cstdint>
#include <cstddef>

// AD5691/2/3 command bytes (upper nibble of the first frame byte)
enum class Command : uint8_t {
    NOP                 = 0x00,  // No operation
    WRITE_INPUT         = 0x10,  // Write input register
    UPDATE_DAC          = 0x20,  // Update DAC register from input register
    WRITE_DAC_AND_INPUT = 0x30,  // Write input register and update DAC register
    WRITE_CONTROL       = 0x40,  // Write control register
};

// Output operating modes (control word D14:D13)
enum class OperatingMode : uint8_t {
    NORMAL                = 0x0,  // Normal operation
    OUTPUT_1K_IMPEDANCE   = 0x1,  // Power-down, 1k to GND
    OUTPUT_100K_IMPEDANCE = 0x2,  // Power-down, 100k to GND
    OUTPUT_TRISTATE       = 0x3,  // Power-down, three-state output
};

// Control register bit layout
namespace CONTROL_BITS {
    constexpr uint16_t RESET       = 0x8000;  // D15: software reset
    constexpr uint8_t  MODE_SHIFT  = 13;      // D14:D13
    constexpr uint16_t MODE_MASK   = 0x6000;
    constexpr uint16_t REF_DISABLE = 0x1000;  // D12: 1 = internal reference off
    constexpr uint16_t GAIN_2X     = 0x0800;  // D11: 1 = 0V to 2xVref
}

// Reserved control word that resets input, DAC and control registers
constexpr uint16_t RESET_WORD = CONTROL_BITS::RESET;

// Logical view of the control register
struct ControlRegister {
    OperatingMode mode = OperatingMode::NORMAL;
    bool reference_enabled = true;
    bool gain_double = false;

    bool operator==(const ControlRegister& other) const {
        return mode == other.mode &&
               reference_enabled == other.reference_enabled &&
               gain_double == other.gain_double;
    }
    bool operator!=(const ControlRegister& other) const { return !(*this == other); }
};

namespace ControlRegisterCodec {

// Pack mode/reference/gain into the 16-bit control word.
// The chip bit is a reference *disable*, so reference_enabled is inverted.
uint16_t encode(OperatingMode mode, bool reference_enabled, bool gain_double);
uint16_t encode(const ControlRegister& reg);

// Unpack a control word. Bits outside D14:D11 are ignored.
ControlRegister decode(uint16_t word);

}  // namespace ControlRegisterCodec

// One write transaction on the wire: [command, payload_hi, payload_lo]
class CommandFrame {
public:
    static constexpr size_t SIZE = 3;

    static CommandFrame build(Command command, uint16_t payload);

    Command command() const { return static_cast<Command>(bytes_[0]); }
    uint16_t payload() const {
        return static_cast<uint16_t>((bytes_[1] << 8) | bytes_[2]);
    }

    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    const std::array<uint8_t, SIZE>& bytes() const { return bytes_; }

private:
    std::array<uint8_t, SIZE> bytes_ = {0, 0, 0};
};

// True if raw is one of the five command bytes the chip accepts
bool is_valid_command(uint8_t raw);

// Upper-case command name for logs
const char* command_name(Command command);

#endif // AD569X_PROTOCOL_HPP
