//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Environment overrides for EvalConfig.
//
//===----------------------------------------------------------------------===//

#include "eval/EvalConfig.hpp"

#include "support/debug_log.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>

namespace kiln::eval
{

namespace
{
std::optional<uint64_t> readUnsigned(const char *name)
{
    const char *text = std::getenv(name);
    if (!text || *text == '\0')
        return std::nullopt;
    errno = 0;
    char *end = nullptr;
    const unsigned long long value = std::strtoull(text, &end, 10);
    if (errno != 0 || *end != '\0' || *text == '-')
    {
        support::debugLog("EVAL", "ignoring malformed %s=%s", name, text);
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}
} // namespace

EvalConfig EvalConfig::fromEnvironment()
{
    EvalConfig config;
    if (auto width = readUnsigned("KILN_POINTER_WIDTH"))
    {
        mem::TargetDataLayout candidate = config.target;
        candidate.pointerSize = *width;
        if (candidate.isSupported())
            config.target = candidate;
        else
            support::debugLog("EVAL", "ignoring unsupported pointer width %llu",
                              static_cast<unsigned long long>(*width));
    }
    if (auto limit = readUnsigned("KILN_MEMORY_LIMIT"))
        config.memoryLimit = *limit;
    if (const char *flag = std::getenv("KILN_DEBUG_EVAL"))
        config.debugLog = flag[0] != '\0';
    return config;
}

} // namespace kiln::eval
