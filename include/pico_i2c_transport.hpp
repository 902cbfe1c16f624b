#ifndef PICO_I2C_TRANSPORT_HPP
#define PICO_I2C_TRANSPORT_HPP

#include <cstdint>
#include <cstddef>

#include "hardware/i2c.h"
#include "pico/mutex.h"
#include "i2c_transport.hpp"

// I2C Configuration Constants
namespace I2C_CONFIG {
    // I2C peripheral instance (i2c0 is a macro, not constexpr-compatible)
    inline i2c_inst_t* get_i2c_instance() { return i2c0; }

    // 400 kHz fast mode (AD569x supports up to 400 kHz)
    constexpr uint32_t BAUDRATE = 400 * 1000;

    // GPIO pins (Pico default I2C0 pins)
    constexpr unsigned int SDA_PIN = 4;  // GP4
    constexpr unsigned int SCL_PIN = 5;  // GP5

    // Upper bound for one 3-byte frame write, including clock stretching
    constexpr uint32_t WRITE_TIMEOUT_US = 5000;
}

// I2cTransport on an RP2040 hardware I2C block
class PicoI2cTransport : public I2cTransport {
public:
    explicit PicoI2cTransport(i2c_inst_t* i2c = I2C_CONFIG::get_i2c_instance());

    // Configure pins, pull-ups and the peripheral. Must precede write().
    void init();

    int write(uint8_t addr, const uint8_t* data, size_t len, bool release_bus) override;

    // Actual SCL frequency after init()
    uint32_t get_baudrate() const { return baudrate_; }

private:
    i2c_inst_t* i2c_;
    mutex_t mutex_;
    uint32_t baudrate_ = 0;
    bool initialized_ = false;

    // Holds the bus mutex for one frame write
    class BusGuard {
    public:
        explicit BusGuard(mutex_t* m) : m_(m) { mutex_enter_blocking(m_); }
        ~BusGuard() { mutex_exit(m_); }
        BusGuard(const BusGuard&) = delete;
        BusGuard& operator=(const BusGuard&) = delete;
    private:
        mutex_t* m_;
    };
};

#endif // PICO_I2C_TRANSPORT_HPP
