#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace craftcalc {

enum class ErrorKind {
    UnknownComponent,
    UnknownIngredient,
    DuplicateName,
    InvalidRate,
    InvalidComponent,
    CycleDetected,
    DepthLimitExceeded,
    CatalogFormatError
};

const char* to_string(ErrorKind kind);

// Base of every error raised by the catalog, engine and loader.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class UnknownComponent : public Error {
public:
    explicit UnknownComponent(const std::string& name)
        : Error(ErrorKind::UnknownComponent, "unknown component: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class UnknownIngredient : public Error {
public:
    UnknownIngredient(const std::string& component, const std::string& ingredient)
        : Error(ErrorKind::UnknownIngredient,
                "component '" + component + "' references unregistered ingredient '" + ingredient + "'"),
          ingredient_(ingredient) {}

    const std::string& ingredient() const { return ingredient_; }

private:
    std::string ingredient_;
};

class DuplicateName : public Error {
public:
    explicit DuplicateName(const std::string& name)
        : Error(ErrorKind::DuplicateName, "component already registered: " + name) {}
};

class InvalidRate : public Error {
public:
    explicit InvalidRate(const std::string& message)
        : Error(ErrorKind::InvalidRate, message) {}
};

class InvalidComponent : public Error {
public:
    explicit InvalidComponent(const std::string& message)
        : Error(ErrorKind::InvalidComponent, message) {}
};

class CycleDetected : public Error {
public:
    CycleDetected(const std::string& component, const std::string& via)
        : Error(ErrorKind::CycleDetected,
                "redefining '" + component + "' would create a cycle through '" + via + "'") {}
};

class DepthLimitExceeded : public Error {
public:
    DepthLimitExceeded(const std::string& component, std::size_t limit)
        : Error(ErrorKind::DepthLimitExceeded,
                "ingredient chain of '" + component + "' is deeper than " + std::to_string(limit)) {}
};

class CatalogFormatError : public Error {
public:
    explicit CatalogFormatError(const std::string& message)
        : Error(ErrorKind::CatalogFormatError, message) {}
};

} // namespace craftcalc
