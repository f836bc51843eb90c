/**
 * @file DomainErrors.hpp
 * @brief Error types raised by the local pipeline (validation, lookup, storage).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace reflectcore::domain {

/// Rejected input (e.g. blank text import). Never persisted.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& msg) : std::invalid_argument(msg) {}
};

/// Operation referenced an unknown record. No partial mutation happened.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

/// Persistence layer failure on save/delete.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace reflectcore::domain
