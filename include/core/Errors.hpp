#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace core {

// Base for every error the indexer raises on purpose.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// bad batch size, unknown mode, non-positive top_k, missing api key
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error("configuration error: " + what) {}
};

// empty flattened text, ragged vector batch, malformed payload or artifact
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what) : Error("validation error: " + what) {}
};

// missing store, missing or empty artifact
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& what) : Error("not found: " + what) {}
};

class DimensionMismatchError : public Error {
public:
    DimensionMismatchError(size_t expected, size_t actual)
        : Error("dimension mismatch: query has " + std::to_string(actual) +
                ", index expects " + std::to_string(expected)),
          m_expected(expected), m_actual(actual) {}

    size_t expected() const { return m_expected; }
    size_t actual() const { return m_actual; }

private:
    size_t m_expected;
    size_t m_actual;
};

// embedding provider failed or returned an inconsistent response
class UpstreamError : public Error {
public:
    explicit UpstreamError(const std::string& what) : Error("upstream error: " + what) {}
};

// sqlite failure
class StoreError : public Error {
public:
    explicit StoreError(const std::string& what) : Error("store error: " + what) {}
};

} // namespace core
