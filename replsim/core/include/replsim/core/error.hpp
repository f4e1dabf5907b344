#pragma once

#include <stdexcept>
#include <string>

namespace replsim::core {

/// @brief Base exception for all replenishment errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch replenishment-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see InvalidParameterError, UnknownEventError
/// @ingroup core
class ReplenishmentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when simulation inputs are rejected.
///
/// Raised synchronously before any simulation step: negative or non-finite
/// demand, negative lead, shipping or safety-stock days, a negative in-transit
/// quantity, or an in-transit quantity without an arrival date. No partial
/// schedule is produced.
///
/// @see validate_inputs, compute_parameters, ReplenishmentError
/// @ingroup core
class InvalidParameterError : public ReplenishmentError {
public:
    using ReplenishmentError::ReplenishmentError;
};

/// @brief Thrown when text does not name a known schedule event kind.
///
/// @see event_kind_from_string, ReplenishmentError
/// @ingroup core
class UnknownEventError : public ReplenishmentError {
public:
    using ReplenishmentError::ReplenishmentError;
};

} // namespace replsim::core
