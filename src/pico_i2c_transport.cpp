#include "pico_i2c_transport.hpp"
#include "pico/stdlib.h"
#include "hardware/gpio.h"
#include <cstdio>

PicoI2cTransport::PicoI2cTransport(i2c_inst_t* i2c) : i2c_(i2c) {}

void PicoI2cTransport::init() {
    mutex_init(&mutex_);

    // Peripheral first, then hand the pins over to it
    baudrate_ = i2c_init(i2c_, I2C_CONFIG::BAUDRATE);

    gpio_set_function(I2C_CONFIG::SDA_PIN, GPIO_FUNC_I2C);
    gpio_set_function(I2C_CONFIG::SCL_PIN, GPIO_FUNC_I2C);

    // Open-drain bus; breakout boards normally carry their own pull-ups too
    gpio_pull_up(I2C_CONFIG::SDA_PIN);
    gpio_pull_up(I2C_CONFIG::SCL_PIN);

    initialized_ = true;
    printf("[I2C] i2c%u up at %lu Hz (SDA=GP%u, SCL=GP%u)\r\n",
           i2c_hw_index(i2c_), static_cast<unsigned long>(baudrate_),
           I2C_CONFIG::SDA_PIN, I2C_CONFIG::SCL_PIN);
}

int PicoI2cTransport::write(uint8_t addr, const uint8_t* data, size_t len, bool release_bus) {
    if (!initialized_) {
        return PICO_ERROR_GENERIC;
    }

    BusGuard guard(&mutex_);

    // nostop = true keeps the controller holding the bus after the last byte
    return i2c_write_timeout_us(i2c_, addr, data, len, !release_bus,
                                I2C_CONFIG::WRITE_TIMEOUT_US);
}
