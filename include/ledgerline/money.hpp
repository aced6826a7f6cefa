#pragma once

#include <cstdint>
#include <vector>

namespace ledgerline {
namespace money {

constexpr int64_t BASIS_POINTS = 10000;
constexpr int64_t MINOR_PER_MAJOR = 100;

/**
 * Quantity, unit price (minor units) and tax rate (basis points) of one line.
 */
struct Line {
    int64_t quantity = 0;
    int64_t unit_price = 0;
    int32_t tax_rate_bp = 0;
};

struct Totals {
    int64_t subtotal = 0;
    int64_t tax = 0;
    int64_t grand_total = 0;
};

/**
 * numerator / denominator rounded to nearest, ties to even.
 * denominator must be positive.
 */
int64_t divide_half_even(int64_t numerator, int64_t denominator);

/**
 * subtotal = sum(qty * price); grand_total = round_half_even(sum(qty * price *
 * (10000 + bp)) / 10000), rounded once over the whole document;
 * tax = grand_total - subtotal.
 *
 * @throws ValidationError on negative inputs or overflow of int64
 */
Totals compute_totals(const std::vector<Line>& lines);

/**
 * Loyalty points for a settled amount: floor(major units * rate_bp / 10000).
 * 275.00 at 10 bp earns 0 points; 10000.00 at 10 bp earns 10.
 */
int64_t loyalty_points(int64_t settled_minor, int32_t rate_bp);

} // namespace money
} // namespace ledgerline
