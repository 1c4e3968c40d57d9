#pragma once

#include <cstdint>

namespace lan_sweep::common
{
    // 16-bit id for DNS / NetBIOS queries.
    uint16_t NextTransactionId();
}
