#pragma once

#include <chrono>
#include <cstdint>

namespace lan_sweep::common
{
    // Milliseconds since the Unix epoch.
    inline int64_t NowMillis()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    inline constexpr int64_t MILLIS_PER_DAY = 86400000LL;
}
