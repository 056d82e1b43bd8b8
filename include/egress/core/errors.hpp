#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Egress {

enum class ErrorCode : uint8_t {
    OK = 0,
    CONFIG_ERROR = 1,         // Insufficient or invalid CPU configuration, fatal at startup
    RESOURCE_EXHAUSTED = 2,   // Admission rejected a start request
    NOT_FOUND = 3,            // Unknown or evicted egress id
    INVALID_STATE = 4,        // Request or transition violates the job lifecycle
    PIPELINE_FAILURE = 5,     // Reported by the pipeline executor
    UNAVAILABLE = 6,          // Service shutting down or no reply from the bus
    MALFORMED = 7             // Undecodable request
};

/**
 * @class EgressError
 * @brief Error raised by service operations, carries an ErrorCode
 */
class EgressError : public std::runtime_error {
public:
    EgressError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

    static const char* codeString(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK:                 return "OK";
            case ErrorCode::CONFIG_ERROR:       return "CONFIG_ERROR";
            case ErrorCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
            case ErrorCode::NOT_FOUND:          return "NOT_FOUND";
            case ErrorCode::INVALID_STATE:      return "INVALID_STATE";
            case ErrorCode::PIPELINE_FAILURE:   return "PIPELINE_FAILURE";
            case ErrorCode::UNAVAILABLE:        return "UNAVAILABLE";
            case ErrorCode::MALFORMED:          return "MALFORMED";
            default:                            return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
};

} // namespace Egress
