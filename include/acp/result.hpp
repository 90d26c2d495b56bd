// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file result.hpp
/// @brief Success-or-error values returned by handlers and collaborators

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace acp
{

// =============================================================================
// Error
// =============================================================================

/// Category of a collaborator failure
///
/// The dispatcher maps each kind onto a JSON-RPC error code; collaborators
/// never deal in wire codes themselves.
enum class ErrorKind
{
    NotFound,
    InvalidArgument,
    Io,
    Network,
    Timeout,
    Remote,
    InvalidResponse,
};

/// A failure description carried by Result
struct Error
{
    ErrorKind kind = ErrorKind::Io;
    std::string message;
};

// =============================================================================
// Result<T>
// =============================================================================

/// Holds either a value of type T or an Error
template <typename T>
class Result
{
  public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    static Result success(T value)
    {
        return Result(std::move(value));
    }

    static Result failure(ErrorKind kind, std::string message)
    {
        return Result(Error{kind, std::move(message)});
    }

    bool ok() const
    {
        return std::holds_alternative<T>(data_);
    }

    explicit operator bool() const
    {
        return ok();
    }

    /// @throws std::logic_error if the result holds an error
    const T& value() const&
    {
        if (!ok())
            throw std::logic_error("Result has no value: " + error().message);
        return std::get<T>(data_);
    }

    T& value() &
    {
        if (!ok())
            throw std::logic_error("Result has no value: " + error().message);
        return std::get<T>(data_);
    }

    T&& value() &&
    {
        if (!ok())
            throw std::logic_error("Result has no value: " + error().message);
        return std::get<T>(std::move(data_));
    }

    /// @throws std::logic_error if the result holds a value
    const Error& error() const
    {
        if (ok())
            throw std::logic_error("Result has no error");
        return std::get<Error>(data_);
    }

  private:
    std::variant<T, Error> data_;
};

/// Result specialization for operations that produce no value
template <>
class Result<void>
{
  public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}

    static Result success()
    {
        return Result();
    }

    static Result failure(ErrorKind kind, std::string message)
    {
        return Result(Error{kind, std::move(message)});
    }

    bool ok() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return ok();
    }

    const Error& error() const
    {
        if (!error_)
            throw std::logic_error("Result has no error");
        return *error_;
    }

  private:
    std::optional<Error> error_;
};

using Status = Result<void>;

} // namespace acp
