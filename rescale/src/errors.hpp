#pragma once

#include <stdexcept>
#include <string>

namespace rescale {

constexpr const char* kErrorPrefix = "[RESCALE] ";

enum class ErrorKind {
    Configuration,
    ResolutionFormat,
    Decode,
    TransformEmpty,
    Persistence,
    Resize,
    Internal,
};

/// Base of every error the tool raises. what() always carries the prefix.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(kErrorPrefix + message), kind_(kind), message_(message) {}

    ErrorKind kind() const { return kind_; }
    /// Message without the prefix, used when wrapping.
    const std::string& message() const { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message)
        : Error(ErrorKind::Configuration, message) {}
};

enum class ResolutionFault {
    Empty,
    Separator,
    TwoValues,
    NotANumber,
    NonPositive,
};

class ResolutionFormatError : public Error {
public:
    ResolutionFormatError(ResolutionFault fault, const std::string& message)
        : Error(ErrorKind::ResolutionFormat, message), fault_(fault) {}

    ResolutionFault fault() const { return fault_; }

private:
    ResolutionFault fault_;
};

class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message)
        : Error(ErrorKind::Decode, message) {}
};

class TransformProducedEmptyResultError : public Error {
public:
    explicit TransformProducedEmptyResultError(const std::string& message)
        : Error(ErrorKind::TransformEmpty, message) {}
};

class PersistenceError : public Error {
public:
    explicit PersistenceError(const std::string& message)
        : Error(ErrorKind::Persistence, message) {}
};

// Raised at the pipeline boundary; cause() is the kind of the wrapped failure.
class ResizeError : public Error {
public:
    ResizeError(ErrorKind cause, const std::string& message)
        : Error(ErrorKind::Resize, message), cause_(cause) {}

    ErrorKind cause() const { return cause_; }

private:
    ErrorKind cause_;
};

} // namespace rescale
