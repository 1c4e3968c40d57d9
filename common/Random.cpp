#include "Random.hpp"
#include <chrono>
#include <iostream>
#include <openssl/rand.h>

namespace lan_sweep::common
{
    uint16_t NextTransactionId()
    {
        unsigned char bytes[2];
        if (RAND_bytes(bytes, sizeof(bytes)) != 1)
        {
            std::cerr << "[Random] OpenSSL RNG failed, using clock-derived id.\n";
            auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
            return static_cast<uint16_t>(ticks & 0xFFFF);
        }
        return static_cast<uint16_t>((bytes[0] << 8) | bytes[1]);
    }
}
