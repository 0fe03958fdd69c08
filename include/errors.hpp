#pragma once

#include <stdexcept>
#include <string>

namespace wx {

// Every rejected request surfaces as one of these. A throw leaves the state
// that existed before the request untouched.
class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Caller lacks the role the operation needs (owner, oracle, arbitrator,
// order owner, registered reporter).
class AuthorizationError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

// Operation is not valid for the entity's current lifecycle state.
class StateError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

// Malformed input: price out of range, duplicate ids, unknown outcome.
class ValidationError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

// Stake or amount below a threshold, or balance below the requested amount.
class InsufficientValueError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

// Structurally impossible state; indicates a defect rather than a bad request.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace wx
