#pragma once
#include <stdexcept>
#include <string>

// Malformed caller argument. Raised before any directory access.
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& msg) : std::invalid_argument(msg) {}
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {}
};

// Directory unreachable or a query failed.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& msg) : std::runtime_error(msg) {}
};
