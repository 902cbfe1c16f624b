// demo firmware: bring up the bus, open the DAC, write a sine wave forever
#include <stdio.h>
#include <cmath>
#include <cstdint>
#include <optional>
#include "pico/stdlib.h"
#include "tusb.h" // tinyusb, for usb serial

#include "dac_config.hpp"
#include "dac_device.hpp"
#include "pico_i2c_transport.hpp"

// Points per sine period
static constexpr size_t WAVE_LENGTH = 100;
static uint16_t wave_table[WAVE_LENGTH];

// Global instances
static PicoI2cTransport i2c_transport;

static void fill_wave_table() {
    constexpr double PI = 3.14159265358979323846;
    for (size_t i = 0; i < WAVE_LENGTH; i++) {
        double s = std::sin(2.0 * PI * static_cast<double>(i) / WAVE_LENGTH);
        wave_table[i] = static_cast<uint16_t>(s * ((1 << 15) - 1) + (1 << 15));
    }
}

int main() {
    // Initialize USB stdio
    stdio_init_all();

    // Wait for USB connection (optional, helps with debugging)
    while (!tud_cdc_connected()) {
        sleep_ms(100);
    }
    sleep_ms(100);  // Extra settle time

    printf("\r\n");
    printf("AD569x DAC demo v0.1\r\n");
#ifdef AD569X_I2C_TRACE
    printf("*** FRAME TRACE ENABLED ***\r\n");
#endif

    i2c_transport.init();
    sleep_ms(AD569X_CONFIG::SETTLE_MS);

    DacError error;
    std::optional<DacDevice> dac = DacDevice::open(i2c_transport, error);
    if (!dac) {
        printf("DAC not found at 0x%02X: %s\r\n",
               AD569X_CONFIG::DEFAULT_ADDRESS, error.describe().c_str());
        while (true) {
            sleep_ms(1000);
        }
    }
    printf("DAC ready at 0x%02X. Writing sine wave.\r\n", dac->address());

    fill_wave_table();

    uint32_t failures = 0;
    while (true) {
        for (size_t i = 0; i < WAVE_LENGTH; i++) {
            DacError result = dac->write_update_dac(wave_table[i]);
            if (!result.ok()) {
                // Report the first failure and then every 1000th
                if (failures % 1000 == 0) {
                    printf("WARNING: %s (failures: %lu)\r\n", result.describe().c_str(),
                           static_cast<unsigned long>(failures + 1));
                }
                failures++;
            }
        }
    }

    return 0;
}
