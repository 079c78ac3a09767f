#pragma once

#include <stdexcept>
#include <string>

// the memory budget is too small for an operator to make progress; retrying with the same budget cannot succeed
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) { }
};

// two values could not be compared, even after implicit coercion
class TypeMismatchError : public std::runtime_error {
public:
    explicit TypeMismatchError(const std::string& what) : std::runtime_error(what) { }
};

// allocating, writing or reading temporary storage failed
class ResourceError : public std::runtime_error {
public:
    explicit ResourceError(const std::string& what) : std::runtime_error(what) { }
};
