#pragma once
#include <stdexcept>
#include <string>

namespace limen {

/// Base class for misuse of a capacity limiter's ownership rules.
/// These are programming errors, they're never raised for an acquire that merely failed or timed out.
class LimiterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A non-reentrant acquire by a task that already holds a token.
class ReentrancyError : public LimiterError {
public:
    ReentrancyError();
};

/// A release by a task that holds no token.
class NotHoldingError : public LimiterError {
public:
    NotHoldingError();
};

/// A reentrant release of more units than the task holds.
class OverReleaseError : public LimiterError {
public:
    OverReleaseError();
};

}
