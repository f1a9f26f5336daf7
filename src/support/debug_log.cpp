//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the environment-gated debug log.  Output is line oriented and
// goes straight to stderr so it interleaves sensibly with compiler output.
//
//===----------------------------------------------------------------------===//

#include "support/debug_log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace kiln::support
{

namespace
{
/// -1: follow the environment, 0: forced off, 1: forced on.
std::atomic<int> gDebugOverride{-1};

bool environmentEnablesLogging() noexcept
{
    static const bool enabled = []
    {
        if (const char *flag = std::getenv("KILN_DEBUG_EVAL"))
            return flag[0] != '\0';
        return false;
    }();
    return enabled;
}
} // namespace

bool isDebugLoggingEnabled() noexcept
{
    const int forced = gDebugOverride.load(std::memory_order_relaxed);
    if (forced >= 0)
        return forced == 1;
    return environmentEnablesLogging();
}

void setDebugLogging(bool enabled) noexcept
{
    gDebugOverride.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

ScopedDebugLogging::ScopedDebugLogging(bool enabled) noexcept
    : previous_(gDebugOverride.exchange(enabled ? 1 : 0, std::memory_order_relaxed))
{
}

ScopedDebugLogging::~ScopedDebugLogging()
{
    gDebugOverride.store(previous_, std::memory_order_relaxed);
}

void debugLog(const char *channel, const char *fmt, ...)
{
    if (!isDebugLoggingEnabled())
        return;
    std::fprintf(stderr, "[DEBUG][%s] ", channel);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace kiln::support
