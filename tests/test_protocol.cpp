#include <gtest/gtest.h>

#include "ad569x_protocol.hpp"

namespace {

const OperatingMode ALL_MODES[] = {
    OperatingMode::NORMAL,
    OperatingMode::OUTPUT_1K_IMPEDANCE,
    OperatingMode::OUTPUT_100K_IMPEDANCE,
    OperatingMode::OUTPUT_TRISTATE,
};

const Command ALL_COMMANDS[] = {
    Command::NOP,
    Command::WRITE_INPUT,
    Command::UPDATE_DAC,
    Command::WRITE_DAC_AND_INPUT,
    Command::WRITE_CONTROL,
};

}  // namespace

TEST(ControlRegisterCodec, DecodeInvertsEncodeOverWholeDomain) {
    for (OperatingMode mode : ALL_MODES) {
        for (bool ref : {true, false}) {
            for (bool gain : {true, false}) {
                ControlRegister reg = ControlRegisterCodec::decode(
                    ControlRegisterCodec::encode(mode, ref, gain));
                EXPECT_EQ(reg.mode, mode);
                EXPECT_EQ(reg.reference_enabled, ref);
                EXPECT_EQ(reg.gain_double, gain);
            }
        }
    }
}

TEST(ControlRegisterCodec, ModeOccupiesBits14To13) {
    EXPECT_EQ(ControlRegisterCodec::encode(OperatingMode::NORMAL, true, false), 0x0000);
    EXPECT_EQ(ControlRegisterCodec::encode(OperatingMode::OUTPUT_1K_IMPEDANCE, true, false), 0x2000);
    EXPECT_EQ(ControlRegisterCodec::encode(OperatingMode::OUTPUT_100K_IMPEDANCE, true, false), 0x4000);
    EXPECT_EQ(ControlRegisterCodec::encode(OperatingMode::OUTPUT_TRISTATE, true, false), 0x6000);
}

TEST(ControlRegisterCodec, ReferenceBitIsInverted) {
    EXPECT_EQ(ControlRegisterCodec::encode(OperatingMode::NORMAL, false, false), 0x1000);
    EXPECT_EQ(ControlRegisterCodec::encode(OperatingMode::NORMAL, true, false) & 0x1000, 0);
}

TEST(ControlRegisterCodec, GainDoubleIsBit11) {
    EXPECT_EQ(ControlRegisterCodec::encode(OperatingMode::NORMAL, true, true), 0x0800);
}

TEST(ControlRegisterCodec, AllFieldsSetLeavesOtherBitsClear) {
    uint16_t word = ControlRegisterCodec::encode(OperatingMode::OUTPUT_TRISTATE, false, true);
    EXPECT_EQ(word, 0x7800);
    EXPECT_EQ(word & ~0x7800, 0);
}

TEST(ControlRegisterCodec, StructOverloadMatchesFieldForm) {
    ControlRegister reg{OperatingMode::OUTPUT_100K_IMPEDANCE, false, true};
    EXPECT_EQ(ControlRegisterCodec::encode(reg),
              ControlRegisterCodec::encode(OperatingMode::OUTPUT_100K_IMPEDANCE, false, true));
}

TEST(ControlRegisterCodec, DecodeIgnoresResetAndReservedBits) {
    ControlRegister reg = ControlRegisterCodec::decode(RESET_WORD | 0x07FF);
    EXPECT_EQ(reg, (ControlRegister{OperatingMode::NORMAL, true, false}));
}

TEST(CommandFrame, ShapeAndByteOrder) {
    const uint16_t payloads[] = {0x0000, 0x00FF, 0xFF00, 0x1234, 0x8000, 0xFFFF};
    for (Command cmd : ALL_COMMANDS) {
        for (uint16_t payload : payloads) {
            CommandFrame frame = CommandFrame::build(cmd, payload);
            ASSERT_EQ(frame.size(), 3u);
            EXPECT_EQ(frame.data()[0], static_cast<uint8_t>(cmd));
            EXPECT_EQ((frame.data()[1] << 8) | frame.data()[2], payload);
            EXPECT_EQ(frame.command(), cmd);
            EXPECT_EQ(frame.payload(), payload);
        }
    }
}

TEST(CommandFrame, ResetFrameBytes) {
    CommandFrame frame = CommandFrame::build(Command::WRITE_CONTROL, RESET_WORD);
    std::array<uint8_t, 3> expected = {0x40, 0x80, 0x00};
    EXPECT_EQ(frame.bytes(), expected);
}

TEST(CommandByte, OnlyFiveBytesAreValid) {
    int valid = 0;
    for (int raw = 0; raw <= 0xFF; raw++) {
        if (is_valid_command(static_cast<uint8_t>(raw))) valid++;
    }
    EXPECT_EQ(valid, 5);
    for (Command cmd : ALL_COMMANDS) {
        EXPECT_TRUE(is_valid_command(static_cast<uint8_t>(cmd)));
    }
    EXPECT_FALSE(is_valid_command(0x50));
    EXPECT_FALSE(is_valid_command(0x11));
}

TEST(CommandByte, Names) {
    EXPECT_STREQ(command_name(Command::WRITE_CONTROL), "WRITE_CONTROL");
    EXPECT_STREQ(command_name(Command::NOP), "NOP");
}
