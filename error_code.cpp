#include "error_code.hpp"

const char *error_code_name(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::Success:
        return "Success";
    case ErrorCode::InputNotFound:
        return "InputNotFound";
    case ErrorCode::OutputAlreadyExists:
        return "OutputAlreadyExists";
    case ErrorCode::InvalidOptions:
        return "InvalidOptions";
    case ErrorCode::ProcessingFailed:
        return "ProcessingFailed";
    case ErrorCode::IOFailure:
        return "IOFailure";
    }
    return "Unknown";
}
