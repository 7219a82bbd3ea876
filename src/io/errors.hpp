#pragma once

#include <stdexcept>
#include <string>

namespace wakefeed {

// ---------------------------------------------------------------------------
// LoadError: a feature store could not be read into memory.
// Raised for an unreadable store, a missing key or attribute, or a payload
// that is not a 2D numeric array. A load that throws leaves no dataset behind.
// ---------------------------------------------------------------------------
struct LoadError : std::runtime_error {
    explicit LoadError(const std::string& what) : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// PreconditionError: an operation was called in a state that forbids it,
// e.g. an order-dependent accessor while shuffling is enabled.
// ---------------------------------------------------------------------------
struct PreconditionError : std::logic_error {
    explicit PreconditionError(const std::string& what) : std::logic_error(what) {}
};

} // namespace wakefeed
