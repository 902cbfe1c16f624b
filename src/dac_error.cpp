#include "dac_error.hpp"
#include <cstdio>

DacError DacError::transport(DacOperation op, int code) {
    DacError err;
    err.status = DacStatus::TRANSPORT_ERROR;
    err.operation = op;
    err.transport_code = code;
    return err;
}

DacError DacError::init_failed(const DacError& cause) {
    DacError err = cause;
    err.status = DacStatus::INIT_FAILED;
    return err;
}

std::string DacError::describe() const {
    if (ok()) {
        return "OK";
    }

    char buf[96];
    if (status == DacStatus::INIT_FAILED) {
        snprintf(buf, sizeof(buf), "init failed: %s: transport error (%d)",
                 operation_name(operation), transport_code);
    } else {
        snprintf(buf, sizeof(buf), "%s: transport error (%d)",
                 operation_name(operation), transport_code);
    }
    return buf;
}

const char* status_name(DacStatus status) {
    switch (status) {
        case DacStatus::OK:              return "OK";
        case DacStatus::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case DacStatus::INIT_FAILED:     return "INIT_FAILED";
    }
    return "UNKNOWN";
}

const char* operation_name(DacOperation op) {
    switch (op) {
        case DacOperation::NONE:             return "none";
        case DacOperation::RESET:            return "reset";
        case DacOperation::SET_MODE:         return "set_mode";
        case DacOperation::WRITE_DAC:        return "write_dac";
        case DacOperation::UPDATE_DAC:       return "update_dac";
        case DacOperation::WRITE_UPDATE_DAC: return "write_update_dac";
    }
    return "unknown";
}
