// Golden/cpp/include/golden/errors.h
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace golden {

enum class ErrorCode {
    Ok = 0,
    IoError,
    ParseError,
    InvalidFormat,
    InvalidArgs,
    InvalidConfig,
    ValidationFailed,
    QuotaUnmet,
    SynthesisFailed,
};

struct Error {
    ErrorCode code{ErrorCode::Ok};
    std::string message;
};

const char* error_code_name(ErrorCode c);

class GoldenException : public std::runtime_error {
public:
    explicit GoldenException(const std::string& msg)
        : std::runtime_error(msg) {}
    GoldenException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_{ErrorCode::InvalidFormat};
};

} // namespace golden
