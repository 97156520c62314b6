#pragma once

// =============================================================================
// Errors - contract violations raised synchronously at the call site
// =============================================================================
//
// None of these are caught inside nodeflow; they always reach the caller.
//

#include <stdexcept>
#include <string>

namespace nodeflow {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// --- Tree structure ---

/// Self-parenting, re-parenting an attached node, cycles, or a freed node.
class InvalidChild : public Error {
public:
    using Error::Error;
};

/// A sibling already uses the child's name.
class DuplicatedChild : public InvalidChild {
public:
    using InvalidChild::InvalidChild;
};

class EmptyName : public Error {
public:
    EmptyName() : Error("Node name must not be empty") {}
};

class AlreadyInGroup : public Error {
public:
    using Error::Error;
};

// --- Signals ---

/// The caller is not the entity that declared the signal.
class SignalNotOwner : public Error {
public:
    using Error::Error;
};

class AlreadyConnected : public Error {
public:
    using Error::Error;
};

class NotConnected : public Error {
public:
    using Error::Error;
};

} // namespace nodeflow
