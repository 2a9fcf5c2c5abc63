#pragma once

#include "fortune/common/errors.h"
#include <string>

namespace fortune::catalogue {

// Base exception for source discovery and index loading
class CatalogueError : public FortuneError
{
public:
    explicit CatalogueError(const std::string& msg) : FortuneError(msg)
    {
    }
};

// Exception for a malformed or out-of-range "N%" prefix
class InvalidWeightError : public CatalogueError
{
public:
    explicit InvalidWeightError(const std::string& msg) : CatalogueError(msg)
    {
    }
};

// Exception for explicit weights summing past 100%
class WeightOverflowError : public CatalogueError
{
public:
    explicit WeightOverflowError(const std::string& msg) : CatalogueError(msg)
    {
    }
};

// Exception for a discovery pass that resolved no usable source
class NoSourcesFoundError : public CatalogueError
{
public:
    explicit NoSourcesFoundError(const std::string& msg) : CatalogueError(msg)
    {
    }
};

}  // namespace fortune::catalogue
