#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace ledgerline {

/**
 * Base exception for all ledger errors.
 *
 * Every error is per-request and recoverable by the caller; none is fatal
 * to the process.
 */
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * gRPC status code reported at the service boundary.
     */
    virtual grpc::StatusCode status_code() const { return grpc::StatusCode::UNKNOWN; }

    /**
     * Returns true if retrying the same request may succeed unchanged.
     */
    virtual bool is_retryable() const { return false; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code(), what());
    }
};

/**
 * Malformed input. Caller's fault, no side effects, not retried.
 */
class ValidationError : public LedgerError {
public:
    explicit ValidationError(const std::string& message)
        : LedgerError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::INVALID_ARGUMENT; }
};

/**
 * Available stock does not cover the request.
 */
class InsufficientStockError : public LedgerError {
public:
    InsufficientStockError(const std::string& message, int64_t requested, int64_t available)
        : LedgerError(message), requested_(requested), available_(available) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }

    int64_t requested() const { return requested_; }
    int64_t available() const { return available_; }

private:
    int64_t requested_;
    int64_t available_;
};

/**
 * The entity is not in a state that permits the requested transition.
 */
class InvalidStateTransitionError : public LedgerError {
public:
    explicit InvalidStateTransitionError(const std::string& message)
        : LedgerError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
};

/**
 * Payment amount outside the allowed range (non-positive or above balance).
 */
class PaymentMismatchError : public LedgerError {
public:
    explicit PaymentMismatchError(const std::string& message)
        : LedgerError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::OUT_OF_RANGE; }
};

/**
 * Optimistic version check failed. Retried internally, then surfaced.
 */
class ConcurrencyConflictError : public LedgerError {
public:
    ConcurrencyConflictError(const std::string& message, uint32_t expected, uint32_t actual)
        : LedgerError(message), expected_(expected), actual_(actual) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::ABORTED; }
    bool is_retryable() const override { return true; }

    uint32_t expected_version() const { return expected_; }
    uint32_t actual_version() const { return actual_; }

private:
    uint32_t expected_;
    uint32_t actual_;
};

/**
 * Referenced entity or reservation is absent.
 */
class NotFoundError : public LedgerError {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::NOT_FOUND; }
};

/**
 * Principal's role is not allowed to invoke the command.
 */
class PermissionDeniedError : public LedgerError {
public:
    explicit PermissionDeniedError(const std::string& message)
        : LedgerError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::PERMISSION_DENIED; }
};

/**
 * No authenticated principal accompanied the command.
 */
class UnauthenticatedError : public LedgerError {
public:
    explicit UnauthenticatedError(const std::string& message)
        : LedgerError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::UNAUTHENTICATED; }
};

} // namespace ledgerline
