#include "statcube/error.hpp"

namespace statcube {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MALFORMED_DOCUMENT:        return "MalformedDocument";
        case ErrorCode::MALFORMED_DIMENSION:       return "MalformedDimension";
        case ErrorCode::MISSING_SIZE:              return "MissingSize";
        case ErrorCode::SHAPE_MISMATCH:            return "ShapeMismatch";
        case ErrorCode::DUPLICATE_COLUMN:          return "DuplicateColumn";
        case ErrorCode::NO_VALUE_COLUMN:           return "NoValueColumn";
        case ErrorCode::DUPLICATE_KEY:             return "DuplicateKey";
        case ErrorCode::UNSUPPORTED_VERSION:       return "UnsupportedVersion";
        case ErrorCode::UNKNOWN_CATEGORY:          return "UnknownCategory";
        case ErrorCode::INCOMPLETE_QUERY:          return "IncompleteQuery";
        case ErrorCode::INDEX_OUT_OF_RANGE:        return "IndexOutOfRange";
        case ErrorCode::INVALID_NAMING_MODE:       return "InvalidNamingMode";
        case ErrorCode::UNSUPPORTED_OUTPUT_FORMAT: return "UnsupportedOutputFormat";
        case ErrorCode::INVALID_CONFIG:            return "InvalidConfig";
        case ErrorCode::HTTP_ERROR:                return "HttpError";
        case ErrorCode::INVALID_URL:               return "InvalidUrl";
        case ErrorCode::NETWORK_ERROR:             return "NetworkError";
    }
    return "Unknown";
}

} // namespace statcube
