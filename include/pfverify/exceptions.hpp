#pragma once
#include <stdexcept>
#include <string>

namespace pfverify
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Receipt or policy path does not exist.
struct NotFoundError : public Error
{
    using Error::Error;
};

/// Receipt is not valid JSON, or policy is not a valid YAML mapping.
struct DecodeError : public Error
{
    using Error::Error;
};

/// Malformed command line.
struct UsageError : public Error
{
    using Error::Error;
};

} // namespace pfverify
