#pragma once

/// @file include/bri/errors.hpp
/// @brief Error kinds raised by the BRI library.
///
/// All of these signal programming-contract violations, never transient
/// conditions. Nothing in the library retries after catching one. Ordinary
/// absence (no neighbor, empty interpolator) is reported through
/// `std::optional` instead.

#include <stdexcept>
#include <string>

namespace bri {

/// Raised by min/max key queries on an empty ObservationStore.
class EmptyStoreError : public std::logic_error {
public:
    explicit EmptyStoreError(const std::string& what) : std::logic_error(what) {}
};

/// Raised when a Brownian process query finds no bracketing observation.
/// The history lost its seed point; the process is unusable.
class HistoryCorruptionError : public std::logic_error {
public:
    explicit HistoryCorruptionError(const std::string& what) : std::logic_error(what) {}
};

/// Raised for malformed construction parameters or query arguments
/// (negative σ, non-finite keys or times, negative sampler stddev).
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace bri
