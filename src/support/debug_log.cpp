//===----------------------------------------------------------------------===//
//
// Part of the Sous project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "support/debug_log.hpp"

#include <cstdio>
#include <cstdlib>

namespace sous::support
{

bool isDebugLoggingEnabled() noexcept
{
    static const bool enabled = []
    {
        if (const char *flag = std::getenv("SOUS_DEBUG"))
            return flag[0] != '\0';
        return false;
    }();
    return enabled;
}

void debugLog(std::string_view component, std::string_view message)
{
    if (!isDebugLoggingEnabled())
        return;
    std::fprintf(stderr,
                 "[DEBUG][%.*s] %.*s\n",
                 static_cast<int>(component.size()),
                 component.data(),
                 static_cast<int>(message.size()),
                 message.data());
}

} // namespace sous::support
