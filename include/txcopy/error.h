#pragma once

#include <stdexcept>
#include <string>

namespace txcopy {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all txcopy exceptions.
///
/// Step code never lets these escape: CopyStep, TrashStep and UntrashStep
/// turn them into StepResult values at their boundary.
class TxcopyError : public std::runtime_error {
public:
    explicit TxcopyError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Specific exception types
// ---------------------------------------------------------------------------

/// An argument bag could not be turned into a typed request
/// (wrong JSON type, malformed envelope).
class InvalidRequestError : public TxcopyError {
public:
    explicit InvalidRequestError(const std::string& msg)
        : TxcopyError("invalid request: " + msg) {}
};

/// A path (or a trash entry for a path) was not found.
class NotFoundError : public TxcopyError {
public:
    explicit NotFoundError(const std::string& path)
        : TxcopyError("not found: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// The destination of a move is already occupied.
class ExistsError : public TxcopyError {
public:
    explicit ExistsError(const std::string& path)
        : TxcopyError("already exists: " + path), path_(path) {}
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// A filesystem I/O error occurred.
class IoError : public TxcopyError {
public:
    explicit IoError(const std::string& msg)
        : TxcopyError("io error: " + msg) {}
};

/// A child process could not be set up (pipe, fork).
/// A child that runs and fails is not an exception; see ProcessResult.
class ProcessError : public TxcopyError {
public:
    explicit ProcessError(const std::string& msg)
        : TxcopyError("process error: " + msg) {}
};

/// A Transaction was used after commit() or rollback().
class TransactionClosedError : public TxcopyError {
public:
    TransactionClosedError() : TxcopyError("transaction already closed") {}
};

} // namespace txcopy
