//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Expected-style return type pairing a value with a Diagnostic.
// Key invariants: An Expected holds exactly one of a value or a diagnostic.
// Ownership/Lifetime: Owns whichever payload it holds.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace xpresso::support
{
using Diag = Diagnostic;

/// @brief Value-or-diagnostic container used for recoverable failures.
/// @tparam T Value type produced on success. Must not be Diag itself.
template <class T> class Expected
{
    static_assert(!std::is_same_v<T, Diag>, "Expected<Diag> is ambiguous");

  public:
    /// @brief Construct a successful result containing @p value.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

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

    /// @brief Access the diagnostic describing the failure; requires !hasValue().
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Expected specialization for operations without a result value.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result.
    Expected() = default;

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag);

    [[nodiscard]] bool hasValue() const;

    explicit operator bool() const;

    /// @brief Access the diagnostic describing the failure; requires !hasValue().
    const Diag &error() const &;

  private:
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Lowercase name of @p severity ("note", "warning", "error").
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location, message and optional code.
Diag makeError(SourceLoc loc, std::string msg, std::string code = {});

/// @brief Print one diagnostic as `path:line:col: severity[code]: message`.
/// @details A non-empty suggestion is printed on a second, indented line.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);
} // namespace xpresso::support
