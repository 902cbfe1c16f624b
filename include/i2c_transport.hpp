#ifndef I2C_TRANSPORT_HPP
#define I2C_TRANSPORT_HPP

#include <cstdint>
#include <cstddef>

// Two-wire bus the DAC driver writes frames through.
// Implementations must hold the bus exclusively for the whole write and
// release it on every return path.
class I2cTransport {
public:
    virtual ~I2cTransport() = default;

    // Write len bytes to 7-bit address addr.
    // release_bus = false leaves the transaction open (no STOP condition).
    // Returns the number of bytes written, or a negative error code.
    virtual int write(uint8_t addr, const uint8_t* data, size_t len, bool release_bus) = 0;
};

#endif // I2C_TRANSPORT_HPP
