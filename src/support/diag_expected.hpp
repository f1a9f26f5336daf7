//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides the Expected container used by every fallible operation
//          in the evaluator, plus diagnostic construction and printing helpers.
// Key invariants: An Expected holds exactly one of a value or an error.
// Ownership/Lifetime: Expected owns its value or error payload.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace kiln::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with an error on failure.
/// @tparam T Stored value type when the operation succeeds.
/// @tparam E Error payload; diagnostics by default, evaluator errors in the core.
/// @note Mirrors the subset of std::expected the project relies on.
template <class T, class E = Diag> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Disabled for arguments decaying to @p E so the error
    ///          constructor below is always chosen for error payloads.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected> &&
                                       std::is_constructible_v<T, U &&>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    T *operator->()
    {
        return &*value_;
    }

    const T *operator->() const
    {
        return &*value_;
    }

    /// @brief Access the error describing the failure; requires !hasValue().
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<E> error_;
};

/// @brief Expected specialization for operations without a result payload.
template <class E> class Expected<void, E>
{
  public:
    /// @brief Construct a successful result.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<E> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location and message.
Diag makeError(SourceLoc loc, std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @details Valid locations are rendered as "#<file>:<line>:<column>: " in front
///          of the severity; the front end maps file ids back to paths.
void printDiag(const Diag &diag, std::ostream &os);
} // namespace kiln::support
