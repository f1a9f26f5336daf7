//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/debug_log.hpp
// Purpose: Opt-in verbose logging for the evaluator internals.
// Key invariants: Logging is off unless KILN_DEBUG_EVAL is set to a non-empty
//                 value or a session forces it on.
// Ownership/Lifetime: Process-wide flag; a ScopedDebugLogging overrides it
//                     until it is destroyed.
// Links: docs/dev/eval.md
//
//===----------------------------------------------------------------------===//

#pragma once

namespace kiln::support
{

/// @brief Whether verbose evaluator logging is currently enabled.
/// @details Reads KILN_DEBUG_EVAL once; a forced override takes precedence.
[[nodiscard]] bool isDebugLoggingEnabled() noexcept;

/// @brief Force verbose logging on or off regardless of the environment.
void setDebugLogging(bool enabled) noexcept;

/// @brief Forces logging on or off for its lifetime, then restores whatever
///        setting was in effect before it.
/// @note Scopes must end in reverse order of creation.
class ScopedDebugLogging
{
  public:
    explicit ScopedDebugLogging(bool enabled) noexcept;
    ~ScopedDebugLogging();

    ScopedDebugLogging(const ScopedDebugLogging &) = delete;
    ScopedDebugLogging &operator=(const ScopedDebugLogging &) = delete;

  private:
    int previous_;
};

/// @brief Emit "[DEBUG][<channel>] <message>" to stderr when logging is enabled.
/// @param channel Short upper-case subsystem tag such as "EVAL" or "MEM".
/// @param fmt printf-style format string.
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
void debugLog(const char *channel, const char *fmt, ...);

} // namespace kiln::support
