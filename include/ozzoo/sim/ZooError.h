#pragma once
// include/ozzoo/sim/ZooError.h
//
// Closed set of recoverable failures reported by zoo operations.
// Every fallible operation returns std::expected<T, ZooError>; a failed
// operation leaves zoo state untouched.

#include <expected>   // C++23
#include <string>
#include <utility>

namespace ozzoo {

struct ZooError {
    enum class Code {
        InsufficientFunds,
        CapacityExceeded,
        SpeciesIncompatibility,
        InvalidAction,
        IoError,
    } code{};
    std::string message;
};

template <class T>
using Result = std::expected<T, ZooError>;

using Status = std::expected<void, ZooError>;

[[nodiscard]] inline const char* ZooErrorCodeName(ZooError::Code c) noexcept
{
    switch (c)
    {
    case ZooError::Code::InsufficientFunds:      return "InsufficientFunds";
    case ZooError::Code::CapacityExceeded:       return "CapacityExceeded";
    case ZooError::Code::SpeciesIncompatibility: return "SpeciesIncompatibility";
    case ZooError::Code::InvalidAction:          return "InvalidAction";
    case ZooError::Code::IoError:                return "IoError";
    }
    return "Unknown";
}

[[nodiscard]] inline std::unexpected<ZooError> Fail(ZooError::Code code, std::string message)
{
    return std::unexpected(ZooError{ code, std::move(message) });
}

} // namespace ozzoo
