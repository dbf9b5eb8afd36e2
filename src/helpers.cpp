#include "chipledger/helpers.hpp"
#include <random>

namespace chipledger {
namespace helpers {

std::string generate_ledger_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t bits = rng();

    static const char hex_chars[] = "0123456789abcdef";
    std::string id(LEDGER_ID_PREFIX);
    id.reserve(id.size() + 12);
    for (int i = 0; i < 12; ++i) {
        id.push_back(hex_chars[bits & 0x0f]);
        bits >>= 4;
    }
    return id;
}

} // namespace helpers
} // namespace chipledger
