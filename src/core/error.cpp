#include "core/error.h"

namespace lingua
{

const char* ToString(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::Disabled: return "Disabled";
        case ErrorKind::NoTranslationService: return "NoTranslationService";
        case ErrorKind::IOFailure: return "IOFailure";
        case ErrorKind::SerializationFailure: return "SerializationFailure";
        case ErrorKind::ServiceFailure: return "ServiceFailure";
        case ErrorKind::ConfigFailure: return "ConfigFailure";
    }
    return "Unknown";
}

std::string Describe(const Error& e)
{
    std::string out = ToString(e.kind);
    if (!e.message.empty())
    {
        out += ": ";
        out += e.message;
    }
    return out;
}

} // namespace lingua
