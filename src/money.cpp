#include "ledgerline/money.hpp"
#include "ledgerline/errors.hpp"

#include <limits>
#include <string>

namespace ledgerline {
namespace money {

namespace {

constexpr int64_t INT64_MAX_VALUE = std::numeric_limits<int64_t>::max();

// Operands are non-negative.
int64_t checked_mul(int64_t a, int64_t b, const char* what) {
    if (a != 0 && b > INT64_MAX_VALUE / a) {
        throw ValidationError(std::string(what) + " overflows");
    }
    return a * b;
}

// Operands are non-negative.
int64_t checked_add(int64_t a, int64_t b, const char* what) {
    if (b > INT64_MAX_VALUE - a) {
        throw ValidationError(std::string(what) + " overflows");
    }
    return a + b;
}

/**
 * quotient + remainder / denominator rounded to nearest, ties to even.
 * 0 <= remainder < denominator.
 */
int64_t round_half_even(int64_t quotient, int64_t remainder, int64_t denominator) {
    int64_t twice = remainder * 2;
    if (twice > denominator || (twice == denominator && (quotient % 2) != 0)) {
        return checked_add(quotient, 1, "rounded amount");
    }
    return quotient;
}

} // anonymous namespace

int64_t divide_half_even(int64_t numerator, int64_t denominator) {
    if (denominator <= 0) {
        throw ValidationError("denominator must be positive");
    }
    if (numerator == std::numeric_limits<int64_t>::min()) {
        throw ValidationError("rounded amount overflows");
    }
    bool negative = numerator < 0;
    int64_t magnitude = negative ? -numerator : numerator;
    int64_t rounded = round_half_even(magnitude / denominator, magnitude % denominator, denominator);
    return negative ? -rounded : rounded;
}

Totals compute_totals(const std::vector<Line>& lines) {
    int64_t subtotal = 0;
    // Tax is sum(net * bp) / 10000, split into whole units and a remainder
    // numerator so that no intermediate exceeds int64.
    int64_t tax_whole = 0;
    int64_t tax_remainder = 0;
    for (const auto& line : lines) {
        if (line.quantity < 0 || line.unit_price < 0 || line.tax_rate_bp < 0) {
            throw ValidationError("line quantity, price and tax rate must be non-negative");
        }
        int64_t net = checked_mul(line.quantity, line.unit_price, "line amount");
        subtotal = checked_add(subtotal, net, "subtotal");
        tax_whole = checked_add(tax_whole, checked_mul(net / BASIS_POINTS, line.tax_rate_bp, "tax"), "tax");
        tax_remainder = checked_add(tax_remainder,
                                    checked_mul(net % BASIS_POINTS, line.tax_rate_bp, "tax"), "tax");
    }
    tax_whole = checked_add(tax_whole, tax_remainder / BASIS_POINTS, "tax");

    Totals totals;
    totals.subtotal = subtotal;
    // Round the full sum so ties see the parity of subtotal + tax.
    int64_t unrounded = checked_add(subtotal, tax_whole, "grand total");
    totals.grand_total = round_half_even(unrounded, tax_remainder % BASIS_POINTS, BASIS_POINTS);
    totals.tax = totals.grand_total - totals.subtotal;
    return totals;
}

int64_t loyalty_points(int64_t settled_minor, int32_t rate_bp) {
    if (settled_minor <= 0 || rate_bp <= 0) return 0;
    constexpr int64_t divisor = BASIS_POINTS * MINOR_PER_MAJOR;
    // floor(settled * bp / divisor) without forming the full product.
    int64_t whole = checked_mul(settled_minor / divisor, rate_bp, "loyalty points");
    int64_t part = checked_mul(settled_minor % divisor, rate_bp, "loyalty points") / divisor;
    return checked_add(whole, part, "loyalty points");
}

} // namespace money
} // namespace ledgerline
