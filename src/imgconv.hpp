#pragma once

#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace fs = std::filesystem;

namespace imgconv {

enum class ErrorKind {
    Environment,
    Format,
    File,
    Transform,
    Encode,
};

class Error : public std::exception {
public:
    Error(const ErrorKind kind, std::string message) : m_kind(kind), m_msg(std::move(message)) {}

    [[nodiscard]] ErrorKind kind() const noexcept {
        return m_kind;
    }

    [[nodiscard]] const char *what() const noexcept override {
        return m_msg.c_str();
    }

private:
    ErrorKind m_kind;
    std::string m_msg;
};

class EnvironmentError final : public Error {
public:
    explicit EnvironmentError(const std::string &message) : Error(ErrorKind::Environment, message) {}
};

class FormatError final : public Error {
public:
    explicit FormatError(const std::string &message) : Error(ErrorKind::Format, message) {}
};

class FileError final : public Error {
public:
    explicit FileError(const std::string &message) : Error(ErrorKind::File, message) {}

    FileError(const fs::path &path, const std::string &message)
        : Error(ErrorKind::File, fmt::format("{} (while opening: {})", message, path.string())) {}
};

class TransformError final : public Error {
public:
    explicit TransformError(const std::string &message) : Error(ErrorKind::Transform, message) {}
};

class EncodeError final : public Error {
public:
    explicit EncodeError(const std::string &message) : Error(ErrorKind::Encode, message) {}
};

// Error value carried by the internal pipeline steps.
struct Failure {
    ErrorKind Kind;
    std::string Message;
};

template <typename... Args>
Failure Fail(const ErrorKind kind, fmt::format_string<Args...> msg_fmt, Args &&... args) {
    return {kind, fmt::format(msg_fmt, std::forward<Args>(args)...)};
}

// An empty Status means success.
using Status = std::optional<Failure>;

template <typename T>
using Result = std::variant<T, Failure>;

template <typename T>
bool Ok(const Result<T> &result) {
    return std::holds_alternative<T>(result);
}

[[noreturn]] inline void Raise(const Failure &failure) {
    switch (failure.Kind) {
    case ErrorKind::Environment:
        throw EnvironmentError(failure.Message);
    case ErrorKind::Format:
        throw FormatError(failure.Message);
    case ErrorKind::File:
        throw FileError(failure.Message);
    case ErrorKind::Transform:
        throw TransformError(failure.Message);
    case ErrorKind::Encode:
        throw EncodeError(failure.Message);
    }
    throw Error(failure.Kind, failure.Message);
}

inline void Check(const Status &status) {
    if (status) {
        Raise(*status);
    }
}

template <typename T>
T Unwrap(Result<T> &&result) {
    if (auto *failure = std::get_if<Failure>(&result)) {
        Raise(*failure);
    }
    return std::get<T>(std::move(result));
}

inline const char *ErrorKindName(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Environment:
        return "EnvironmentError";
    case ErrorKind::Format:
        return "FormatError";
    case ErrorKind::File:
        return "FileError";
    case ErrorKind::Transform:
        return "TransformError";
    case ErrorKind::Encode:
        return "EncodeError";
    }
    return "Error";
}

} // namespace imgconv
