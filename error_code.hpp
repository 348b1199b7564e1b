#pragma once

#include <stdexcept>
#include <string>

// Outcome of a redaction run. The numeric value is also the process exit code.
enum class ErrorCode {
    Success = 0,
    InputNotFound = 1,
    OutputAlreadyExists = 2,
    InvalidOptions = 3,
    ProcessingFailed = 4,
    IOFailure = 5
};

const char *error_code_name(ErrorCode code);

// Failure carrying the code it should be reported as.
class RedactError : public std::runtime_error
{
public:
    RedactError(ErrorCode code, const std::string &what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};
