#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace conduit {

/**
 * Base exception for all conduit errors.
 *
 * Each error carries the gRPC status code a transport binding should
 * report for it.
 */
class ConduitError : public std::runtime_error {
public:
    explicit ConduitError(const std::string& message)
        : std::runtime_error(message) {}

    virtual grpc::StatusCode status_code() const { return grpc::StatusCode::UNKNOWN; }

    /**
     * Returns true if this is a "not found" error.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if this is a "precondition failed" error.
     */
    virtual bool is_precondition_failed() const { return false; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if this is an "already exists" error.
     */
    virtual bool is_already_exists() const { return false; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code(), what());
    }
};

/**
 * Thrown when a command fails a structural validation rule,
 * e.g. validating a workflow that has no steps.
 */
class ValidationError : public ConduitError {
public:
    explicit ValidationError(const std::string& message)
        : ConduitError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
    bool is_precondition_failed() const override { return true; }
};

/**
 * Thrown when a command is not legal in the aggregate's current state.
 * The aggregate is left unchanged.
 */
class InvalidStateError : public ConduitError {
public:
    explicit InvalidStateError(const std::string& message)
        : ConduitError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
    bool is_precondition_failed() const override { return true; }
};

/**
 * Thrown when a child entity with the same identity already exists.
 */
class DuplicateEntityError : public ConduitError {
public:
    explicit DuplicateEntityError(const std::string& message)
        : ConduitError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::ALREADY_EXISTS; }
    bool is_already_exists() const override { return true; }
};

/**
 * Thrown when a command references a child entity that does not exist.
 */
class EntityNotFoundError : public ConduitError {
public:
    explicit EntityNotFoundError(const std::string& message)
        : ConduitError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::NOT_FOUND; }
    bool is_not_found() const override { return true; }
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public ConduitError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : ConduitError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::INVALID_ARGUMENT; }
    bool is_invalid_argument() const override { return true; }
};

/**
 * Thrown when the router cannot acquire one of its internal locks.
 * Router state is left untouched; the operation simply did not happen.
 */
class RoutingError : public ConduitError {
public:
    explicit RoutingError(const std::string& message)
        : ConduitError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::INTERNAL; }
};

/**
 * Thrown when a sequence counter would wrap.
 */
class SequenceOverflowError : public RoutingError {
public:
    explicit SequenceOverflowError(const std::string& message)
        : RoutingError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::OUT_OF_RANGE; }
};

/**
 * Thrown by the event sequencer when an aggregate's stream has a gap it
 * cannot buffer.
 */
class SequenceGapError : public ConduitError {
public:
    explicit SequenceGapError(const std::string& message)
        : ConduitError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::OUT_OF_RANGE; }
};

} // namespace conduit
