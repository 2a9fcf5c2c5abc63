#pragma once

#include "fortune/common/errors.h"
#include <string>

namespace fortune::strfile {

// Base exception for index (de)serialization and index file I/O
class StrfileError : public FortuneError
{
public:
    explicit StrfileError(const std::string& msg) : FortuneError(msg)
    {
    }
};

// Exception for a malformed or truncated .dat index
class CorruptIndexError : public StrfileError
{
public:
    explicit CorruptIndexError(const std::string& msg) : StrfileError(msg)
    {
    }
};

}  // namespace fortune::strfile
