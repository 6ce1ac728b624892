#pragma once

#include <stdexcept>
#include <string>

namespace statcube {

/**
 * Error kinds raised by the codec, the document layer and the fetcher.
 * Every failure aborts the current read/write/query call.
 */
enum class ErrorCode {
    // Document structure
    MALFORMED_DOCUMENT = 1,
    MALFORMED_DIMENSION = 2,
    MISSING_SIZE = 3,
    SHAPE_MISMATCH = 4,

    // Table encoding
    DUPLICATE_COLUMN = 100,
    NO_VALUE_COLUMN = 101,
    DUPLICATE_KEY = 102,
    UNSUPPORTED_VERSION = 103,

    // Queries
    UNKNOWN_CATEGORY = 200,
    INCOMPLETE_QUERY = 201,
    INDEX_OUT_OF_RANGE = 202,

    // Caller arguments
    INVALID_NAMING_MODE = 300,
    UNSUPPORTED_OUTPUT_FORMAT = 301,
    INVALID_CONFIG = 302,

    // Fetch collaborator
    HTTP_ERROR = 400,
    INVALID_URL = 401,
    NETWORK_ERROR = 402
};

const char* error_code_name(ErrorCode code) noexcept;

class StatcubeException : public std::runtime_error {
public:
    explicit StatcubeException(ErrorCode code, const std::string& message,
                               const std::string& context = "")
        : std::runtime_error(format_message(code, message, context))
        , code_(code)
        , context_(context) {}

    ErrorCode code() const noexcept { return code_; }

    // Offending identifier: dimension id, column name, index value or URL
    const std::string& context() const noexcept { return context_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context) {
        std::string result = std::string(error_code_name(code)) + ": " + message;
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
};

// Convenience exception types
class MalformedDimensionError : public StatcubeException {
public:
    explicit MalformedDimensionError(const std::string& message, const std::string& dimension)
        : StatcubeException(ErrorCode::MALFORMED_DIMENSION, message, dimension) {}
};

class IndexOutOfRangeError : public StatcubeException {
public:
    explicit IndexOutOfRangeError(const std::string& message, const std::string& index)
        : StatcubeException(ErrorCode::INDEX_OUT_OF_RANGE, message, index) {}
};

class HttpError : public StatcubeException {
public:
    HttpError(int status, const std::string& reason, const std::string& url)
        : StatcubeException(ErrorCode::HTTP_ERROR,
                            std::to_string(status) + " " + reason, url)
        , status_(status)
        , reason_(reason) {}

    int status() const noexcept { return status_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    int status_;
    std::string reason_;
};

class InvalidUrlError : public StatcubeException {
public:
    explicit InvalidUrlError(const std::string& message, const std::string& url)
        : StatcubeException(ErrorCode::INVALID_URL, message, url) {}
};

class NetworkError : public StatcubeException {
public:
    explicit NetworkError(const std::string& message, const std::string& url)
        : StatcubeException(ErrorCode::NETWORK_ERROR, message, url) {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "") {
        if (!condition) {
            throw StatcubeException(code, message, context);
        }
    }
};

#define STATCUBE_CHECK(condition, code, message, context) \
    statcube::ErrorHandler::check_condition(condition, code, message, context)

#define STATCUBE_THROW(code, message, context) \
    throw statcube::StatcubeException(code, message, context)

} // namespace statcube
