#pragma once

#include <stdexcept>
#include <string>

namespace fortune {

// Base exception for all fortune-tools errors
class FortuneError : public std::runtime_error
{
public:
    explicit FortuneError(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

}  // namespace fortune
