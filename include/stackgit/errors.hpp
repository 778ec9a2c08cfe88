#pragma once
#include <stdexcept>
#include <string>

namespace stackgit {

// Base of every failure raised by this library.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The object, or the path inside a tree-ish, does not exist.
class ObjectNotFound : public Error {
public:
  using Error::Error;
};

// The caller handed over something the store cannot represent
// (a name with a slash, a missing mode, a bad path).
class InvalidEntry : public Error {
public:
  using Error::Error;
};

// Spawning, talking to, or waiting on the store process failed.
class StoreIOError : public Error {
public:
  using Error::Error;
};

// The store answered, but not in the expected format.
class ProtocolError : public Error {
public:
  using Error::Error;
};

// Bookkeeping inside the patch engine went wrong. Always a bug.
class InternalInvariantViolation : public Error {
public:
  using Error::Error;
};

// A stop was requested while the operation was running.
class Cancelled : public Error {
public:
  Cancelled() : Error("operation cancelled") {}
  using Error::Error;
};

} // namespace stackgit
