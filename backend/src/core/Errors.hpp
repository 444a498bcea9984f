#pragma once
#include <stdexcept>
#include <string>

// Every rejected operation throws one of these before any state is written,
// so callers can retry safely.
class RetainError : public std::runtime_error {
public:
    explicit RetainError(const std::string& what) : std::runtime_error(what) {}
};

// A status edge that the transition tables do not permit.
class InvalidTransition : public RetainError {
public:
    explicit InvalidTransition(const std::string& what) : RetainError(what) {}
};

// Malformed review input (rating outside the four levels, negative latency).
class InvalidRating : public RetainError {
public:
    explicit InvalidRating(const std::string& what) : RetainError(what) {}
};

class NotFound : public RetainError {
public:
    explicit NotFound(const std::string& what) : RetainError(what) {}
};

// Only raised when the producer asked for strict import.
class DuplicateExternalKey : public RetainError {
public:
    explicit DuplicateExternalKey(const std::string& what) : RetainError(what) {}
};

// Empty text, empty front/back, duplicate tag name and similar input errors.
class ValidationError : public RetainError {
public:
    explicit ValidationError(const std::string& what) : RetainError(what) {}
};

class DraftParseError : public RetainError {
public:
    explicit DraftParseError(const std::string& what) : RetainError(what) {}
};

class StorageError : public RetainError {
public:
    explicit StorageError(const std::string& what) : RetainError(what) {}
};
