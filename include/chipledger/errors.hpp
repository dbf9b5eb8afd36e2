#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace chipledger {

/**
 * Base exception for all settlement errors.
 */
class SettlementError : public std::runtime_error {
public:
    explicit SettlementError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * The gRPC status code this error maps to at the RPC boundary.
     */
    virtual grpc::StatusCode status_code() const { return grpc::StatusCode::UNKNOWN; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if this is a "precondition failed" error.
     */
    virtual bool is_precondition_failed() const { return false; }

    /**
     * Returns true if this is a "not found" error.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if the caller may retry the same request unchanged.
     */
    virtual bool is_retryable() const { return false; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code(), what());
    }
};

/**
 * A player record holds a structurally impossible value
 * (negative or non-finite amount, missing or duplicated user id).
 * Maps to gRPC INVALID_ARGUMENT.
 */
class InvalidRecordError : public SettlementError {
public:
    explicit InvalidRecordError(const std::string& message)
        : SettlementError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::INVALID_ARGUMENT; }
    bool is_invalid_argument() const override { return true; }
};

/**
 * Net balances do not sum to zero beyond the per-player rounding tolerance.
 * Maps to gRPC FAILED_PRECONDITION.
 */
class UnbalancedLedgerError : public SettlementError {
public:
    explicit UnbalancedLedgerError(const std::string& message)
        : SettlementError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
    bool is_precondition_failed() const override { return true; }
};

/**
 * The atomic settle transition could not be completed.
 * Maps to gRPC ABORTED.
 */
class ConcurrentSettlementError : public SettlementError {
public:
    explicit ConcurrentSettlementError(const std::string& message)
        : SettlementError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::ABORTED; }
    bool is_retryable() const override { return true; }
};

/**
 * The settlement store rejected or failed a write.
 * Maps to gRPC UNAVAILABLE.
 */
class StorageError : public SettlementError {
public:
    explicit StorageError(const std::string& message)
        : SettlementError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::UNAVAILABLE; }
    bool is_retryable() const override { return true; }
};

/**
 * Thrown when a game settlement or ledger entry does not exist.
 */
class NotFoundError : public SettlementError {
public:
    explicit NotFoundError(const std::string& message)
        : SettlementError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::NOT_FOUND; }
    bool is_not_found() const override { return true; }
};

/**
 * Thrown when a user acts on a ledger entry they are not part of.
 */
class PermissionDeniedError : public SettlementError {
public:
    explicit PermissionDeniedError(const std::string& message)
        : SettlementError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::PERMISSION_DENIED; }
};

} // namespace chipledger
