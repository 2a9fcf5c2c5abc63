#pragma once

#include "fortune/common/errors.h"
#include <string>

namespace fortune::selector {

// Exception for a request that no entry of the catalogue satisfies
class NoMatchingQuotationError : public FortuneError
{
public:
    explicit NoMatchingQuotationError(const std::string& msg)
        : FortuneError(msg)
    {
    }
};

// Exception for a regular expression that does not compile
class InvalidPatternError : public FortuneError
{
public:
    explicit InvalidPatternError(const std::string& msg) : FortuneError(msg)
    {
    }
};

}  // namespace fortune::selector
