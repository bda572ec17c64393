#include "errors.hpp"

#define STRERROR_GEN(code, name, str) \
    case code:                        \
        return str;
const char* Error::strerror() const
{
    switch (code) {
        ADDITIONAL_ERRNO_MAP(STRERROR_GEN)
    }
    return "unknown error";
}
#undef STRERROR_GEN

#define ERR_NAME_GEN(code, name, _) \
    case code:                      \
        return #name;
const char* Error::err_name() const
{

    switch (code) {
        ADDITIONAL_ERRNO_MAP(ERR_NAME_GEN)
    }
    return "unknown";
#undef ERR_NAME_GEN
}

std::string Error::format() const { return std::string(err_name()) + " (" + strerror() + ")"; }

ErrorKind Error::kind() const
{
    if (code == 0)
        return ErrorKind::None;
    switch (code / 100) {
    case 1:
        return ErrorKind::InvalidInput;
    case 2:
        return ErrorKind::Unauthorized;
    case 3:
        return ErrorKind::InsufficientFunds;
    case 4:
        return ErrorKind::NotFound;
    case 5:
        return ErrorKind::InvariantViolation;
    case 6:
        return ErrorKind::ReentrancyBlocked;
    case 7:
        return ErrorKind::ExternalCallFailed;
    default:
        return ErrorKind::Other;
    }
}

const char* kind_name(ErrorKind k)
{
    switch (k) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InvalidInput:
        return "InvalidInput";
    case ErrorKind::Unauthorized:
        return "Unauthorized";
    case ErrorKind::InsufficientFunds:
        return "InsufficientFunds";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::InvariantViolation:
        return "InvariantViolation";
    case ErrorKind::ReentrancyBlocked:
        return "ReentrancyBlocked";
    case ErrorKind::ExternalCallFailed:
        return "ExternalCallFailed";
    case ErrorKind::Other:
        break;
    }
    return "Other";
}
