#include "chipledger/money.hpp"
#include "chipledger/validation.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace chipledger {
namespace money {

Cents to_cents(double amount, const std::string& field_name) {
    validation::require_finite(amount, field_name);

    double scaled = amount * 100.0;
    if (std::fabs(scaled) >= static_cast<double>(std::numeric_limits<Cents>::max() / 2)) {
        throw InvalidRecordError(field_name + " is out of range");
    }

    double floor_value = std::floor(scaled);
    double fraction = scaled - floor_value;
    if (std::fabs(fraction - 0.5) < HALF_CENT_TOLERANCE) {
        auto lower = static_cast<Cents>(floor_value);
        return (lower % 2 == 0) ? lower : lower + 1;
    }
    return static_cast<Cents>(std::llround(scaled));
}

Cents checked_add(Cents a, Cents b, const std::string& what) {
    Cents sum = 0;
    if (__builtin_add_overflow(a, b, &sum)) {
        throw InvalidRecordError(what + " is out of range");
    }
    return sum;
}

std::string format_cents(Cents amount) {
    std::ostringstream ss;
    if (amount < 0) ss << '-';
    auto magnitude = static_cast<unsigned long long>(amount < 0 ? -(amount + 1) + 1 : amount);
    ss << magnitude / 100 << '.' << std::setfill('0') << std::setw(2) << magnitude % 100;
    return ss.str();
}

} // namespace money
} // namespace chipledger
