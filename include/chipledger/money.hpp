#pragma once

#include <string>
#include "types.hpp"

namespace chipledger {
namespace money {

/// Scaled values this close to an exact half cent are treated as exact halves.
constexpr double HALF_CENT_TOLERANCE = 1e-6;

/**
 * Convert a decimal currency amount to integer cents, rounding half to even.
 *
 * Binary noise is absorbed so that inputs such as 1.015 and 1.005 round the
 * way their decimal text would (to 102 and 100 respectively).
 *
 * @throws InvalidRecordError if the value is NaN or infinite
 */
Cents to_cents(double amount, const std::string& field_name = "amount");

/**
 * Add two cent amounts.
 *
 * @throws InvalidRecordError if the sum does not fit in Cents
 */
Cents checked_add(Cents a, Cents b, const std::string& what = "amount");

/**
 * Render cents as a signed decimal string ("-12.34"). For logs only.
 */
std::string format_cents(Cents amount);

} // namespace money
} // namespace chipledger
