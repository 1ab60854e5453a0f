// ============= include/core/errors.hpp =============
/*
 * Persistence error taxonomy
 *
 * PersistenceError (std::runtime_error)
 * ├── ValidationError          bad input shape or range, never retried
 * │   └── DimensionMismatchError
 * ├── NotFoundError            referenced entity/user does not exist
 * ├── NotInitializedError      operation before PersonaStore::initialize()
 * ├── BackendUnavailableError  native backend could not be acquired
 * ├── CapacityExceededError    vector index is full
 * └── BackendError             driver rejected a statement or file I/O failed
 */

#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ValidationError : public PersistenceError {
public:
    using PersistenceError::PersistenceError;
};

class DimensionMismatchError : public ValidationError {
public:
    DimensionMismatchError(std::size_t expected, std::size_t actual)
        : ValidationError("vector dimension mismatch: expected " + std::to_string(expected) +
                          ", got " + std::to_string(actual)),
          expected_dim(expected), actual_dim(actual) {}

    std::size_t expected() const { return expected_dim; }
    std::size_t actual() const { return actual_dim; }

private:
    std::size_t expected_dim;
    std::size_t actual_dim;
};

class NotFoundError : public PersistenceError {
public:
    NotFoundError(const std::string& kind, const std::string& id)
        : PersistenceError(kind + " not found: " + id), missing_id(id) {}

    const std::string& id() const { return missing_id; }

private:
    std::string missing_id;
};

class NotInitializedError : public PersistenceError {
public:
    explicit NotInitializedError(const std::string& operation)
        : PersistenceError(operation + ": store is not initialized") {}
};

class BackendUnavailableError : public PersistenceError {
public:
    using PersistenceError::PersistenceError;
};

class CapacityExceededError : public PersistenceError {
public:
    explicit CapacityExceededError(std::size_t capacity)
        : PersistenceError("vector index capacity exceeded (" + std::to_string(capacity) +
                           " slots); rebuild with a larger capacity"),
          max_elements(capacity) {}

    std::size_t capacity() const { return max_elements; }

private:
    std::size_t max_elements;
};

class BackendError : public PersistenceError {
public:
    BackendError(const std::string& operation, const std::string& detail,
                 const std::string& entity_id = "")
        : PersistenceError(operation + (entity_id.empty() ? "" : " [" + entity_id + "]") +
                           ": " + detail),
          op(operation) {}

    const std::string& operation() const { return op; }

private:
    std::string op;
};
