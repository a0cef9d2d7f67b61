#pragma once

#include <stdexcept>
#include <string>

namespace optval {

// Base class for every error raised by the validation core
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message) : std::runtime_error(message) {}
};

// Fewer observations than a method's statistical minimum
class InsufficientDataError : public ValidationError {
public:
    InsufficientDataError(const std::string& message, size_t available, size_t required)
        : ValidationError(message), available_(available), required_(required) {}

    size_t available() const { return available_; }
    size_t required() const { return required_; }

private:
    size_t available_;
    size_t required_;
};

// No price observation at a required date
class MissingMarketDataError : public ValidationError {
public:
    explicit MissingMarketDataError(const std::string& message) : ValidationError(message) {}
};

// Shape mismatch between related inputs (e.g. exit premiums vs legs)
class ArgumentMismatchError : public ValidationError {
public:
    explicit ArgumentMismatchError(const std::string& message) : ValidationError(message) {}
};

// Operation not allowed in the position's current lifecycle state
class PositionStateError : public ValidationError {
public:
    explicit PositionStateError(const std::string& message) : ValidationError(message) {}
};

// HTTP or file retrieval failed
class DataFetchError : public ValidationError {
public:
    explicit DataFetchError(const std::string& message) : ValidationError(message) {}
};

// Volatility model estimation did not converge
class NumericalFitError : public ValidationError {
public:
    explicit NumericalFitError(const std::string& message) : ValidationError(message) {}
};

} // namespace optval
