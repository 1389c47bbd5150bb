#pragma once

#include <stdexcept>
#include <string>

namespace chronix {
namespace core {

// Raised before any placement work when the caller hands in unusable input.
class InvalidInputError : public std::invalid_argument
{
public:
    explicit InvalidInputError(const std::string &message)
        : std::invalid_argument(message)
    {
    }
};

} // namespace core
} // namespace chronix
