#ifndef DAC_ERROR_HPP
#define DAC_ERROR_HPP

#include <cstdint>
#include <string>

// Outcome of a driver call
enum class DacStatus : uint8_t {
    OK,
    TRANSPORT_ERROR,  // Bus write failed on a ready device
    INIT_FAILED,      // Reset/configure sequence failed, no device produced
};

// Logical operation in flight when a failure occurred
enum class DacOperation : uint8_t {
    NONE,
    RESET,
    SET_MODE,
    WRITE_DAC,
    UPDATE_DAC,
    WRITE_UPDATE_DAC,
};

struct DacError {
    DacStatus status = DacStatus::OK;
    DacOperation operation = DacOperation::NONE;
    int transport_code = 0;  // Negative transport status, 0 when not applicable

    bool ok() const { return status == DacStatus::OK; }

    static DacError success() { return DacError(); }
    static DacError transport(DacOperation op, int code);

    // Re-tag a failure from the construction sequence as INIT_FAILED
    static DacError init_failed(const DacError& cause);

    // e.g. "init failed: reset: transport error (-1)"
    std::string describe() const;
};

const char* status_name(DacStatus status);
const char* operation_name(DacOperation op);

#endif // DAC_ERROR_HPP
