// cpp/src/errors.cpp
#include "redline/errors.h"

namespace redline {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:             return "OK";
        case ErrorCode::InvalidArgs:    return "INVALID_ARGS";
        case ErrorCode::InvalidFormat:  return "INVALID_FORMAT";
        case ErrorCode::BombSuspected:  return "BOMB_SUSPECTED";
        case ErrorCode::CorruptArchive: return "CORRUPT_ARCHIVE";
        case ErrorCode::Overloaded:     return "OVERLOADED";
        case ErrorCode::SessionFailed:  return "SESSION_FAILED";
        case ErrorCode::InvalidEdits:   return "INVALID_EDITS";
        case ErrorCode::ApplyFailed:    return "APPLY_FAILED";
        case ErrorCode::RepackFailed:   return "REPACK_FAILED";
        case ErrorCode::Internal:       return "INTERNAL";
    }
    return "UNKNOWN";
}

} // namespace redline
