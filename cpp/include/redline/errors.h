// cpp/include/redline/errors.h
#pragma once
#include <stdexcept>
#include <string>

namespace redline {

enum class ErrorCode {
    Ok = 0,
    InvalidArgs,
    InvalidFormat,
    BombSuspected,
    CorruptArchive,
    Overloaded,
    SessionFailed,
    InvalidEdits,
    ApplyFailed,
    RepackFailed,
    Internal,
};

const char* error_code_name(ErrorCode code);

struct Error {
    ErrorCode code{ErrorCode::Ok};
    std::string message;
};

class RedlineException : public std::runtime_error {
public:
    RedlineException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace redline
