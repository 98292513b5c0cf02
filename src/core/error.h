#pragma once

#include <string>

namespace lingua
{

enum class ErrorKind
{
    Disabled,              // store turned off; mutating operations refuse
    NoTranslationService,  // no capability configured
    IOFailure,             // directory/file create, read, write or delete
    SerializationFailure,  // table could not be encoded to the strings format
    ServiceFailure,        // opaque failure reported by the translation service
    ConfigFailure,         // config file present but invalid
};

struct Error
{
    ErrorKind   kind = ErrorKind::IOFailure;
    std::string message;

    static Error Make(ErrorKind k, std::string msg)
    {
        Error e;
        e.kind = k;
        e.message = std::move(msg);
        return e;
    }
};

const char* ToString(ErrorKind kind);

// "IOFailure: <message>" (or just the kind name when the message is empty).
std::string Describe(const Error& e);

} // namespace lingua
