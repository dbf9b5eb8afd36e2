#pragma once

#include <string>
#include "types.hpp"

namespace chipledger {

/**
 * Helper functions shared by the settlement components.
 */
namespace helpers {

constexpr const char* LEDGER_ID_PREFIX = "led_";

/**
 * Generate a ledger id: LEDGER_ID_PREFIX followed by 12 lowercase hex digits.
 */
std::string generate_ledger_id();

/**
 * Current wall-clock time.
 */
inline Clock::time_point now() { return Clock::now(); }

} // namespace helpers
} // namespace chipledger
