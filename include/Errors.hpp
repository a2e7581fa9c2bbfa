#pragma once
#include <stdexcept>
#include <string>

// Malformed input: dimension mismatch, m >= n, non-finite entries, bad options.
// Raised before any iteration runs.
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}
};

// A A^T is not numerically SPD, or the iteration produced a non-finite value.
class NumericalError : public std::runtime_error {
public:
    explicit NumericalError(const std::string& what) : std::runtime_error(what) {}
};
