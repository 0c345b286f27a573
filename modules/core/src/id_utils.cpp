#include "id_utils.h"
#include <mutex>
#include <random>

std::string generate_uuid_v4() {
    static std::mutex mu;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<int> dis(0, 15);

    static const char* hex_chars = "0123456789abcdef";
    std::string uuid;
    uuid.reserve(36);

    std::lock_guard<std::mutex> lock(mu);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) uuid += '-';
        int nibble = dis(gen);
        if (i == 12) nibble = 4;                   // version
        if (i == 16) nibble = 8 | (nibble & 0x3);  // variant 10xx
        uuid += hex_chars[nibble];
    }
    return uuid;
}
