#include "Status.hpp"

namespace flm {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InitializationError: return "INITIALIZATION_ERROR";
        case ErrorCode::InvalidInputError:   return "INVALID_INPUT";
        case ErrorCode::InvalidModeError:    return "INVALID_MODE";
        case ErrorCode::SequencingError:     return "SEQUENCING_ERROR";
        case ErrorCode::InternalError:       return "INTERNAL";
    }
    return "UNKNOWN";
}

std::string Error::toString() const {
    return std::string(errorCodeName(code)) + ": " + message;
}

} // namespace flm
