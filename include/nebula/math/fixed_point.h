// NEBULA - Fixed-Point Arithmetic
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Unsigned 18-decimal fixed-point arithmetic on 256-bit words.
//
// Every operation is pure and integer-only, so two builds always agree on
// every bit of every result. Rounding is truncation toward zero at each
// division. Failures throw OracleError:
// - ArithmeticOverflow when a result does not fit in 256 bits
// - DivisionByZero on a zero divisor
// - InvalidDomain for ln(0) and exp() inputs whose result is unrepresentable

#ifndef NEBULA_MATH_FIXED_POINT_H
#define NEBULA_MATH_FIXED_POINT_H

#include <nebula/core/types.h>

#include <cstdint>
#include <string>

namespace nebula {
namespace math {

// ============================================================================
// Constants
// ============================================================================

/// Number of decimals of the canonical fixed-point representation
constexpr unsigned FIXED_DECIMALS = 18;

/// 1.0 in fixed point (1e18)
inline const UInt256 UNIT{1000000000000000000ULL};

/// log2(e) in fixed point
inline const UInt256 LOG2_E{1442695040888963407ULL};

/// ln(2) with 36 decimals, used for range reduction in Exp
inline const UInt512 LN2_36{"693147180559945309417232121458176568"};

/// Inputs at or below this make Exp() return zero (result < 1e-18)
inline const Int256 EXP_MIN_INPUT{"-41446531673892822313"};

/// Inputs at or above this make Exp() fail (result >= 2^255 / 1e18)
inline const Int256 EXP_MAX_INPUT{"135305999368893231589"};

// ============================================================================
// Arithmetic
// ============================================================================

/// floor(x * y / d) with a 512-bit intermediate product
UInt256 MulDiv(const UInt256& x, const UInt256& y, const UInt256& d);

/// Fixed-point multiply: floor(x * y / 1e18)
UInt256 Mul(const UInt256& x, const UInt256& y);

/// Fixed-point divide: floor(x * 1e18 / y)
UInt256 Div(const UInt256& x, const UInt256& y);

/// 10^n for n <= 77
UInt256 Pow10(unsigned n);

// ============================================================================
// Transcendental
// ============================================================================

/**
 * Natural logarithm.
 *
 * Computed as log2(x) / log2(e), where log2 takes its integer part from the
 * most significant bit and its fractional part by repeated squaring.
 *
 * @param x Fixed-point input, must be > 0
 * @return Signed fixed-point ln(x)
 */
Int256 Ln(const UInt256& x);

/**
 * Natural exponent.
 *
 * Range-reduces x to k*ln2 + r with 0 <= r < ln2, sums the Taylor series of
 * e^r at 36 decimals and scales by 2^k.
 *
 * @param x Signed fixed-point exponent, must be < EXP_MAX_INPUT
 * @return Fixed-point e^x (zero when x <= EXP_MIN_INPUT)
 */
UInt256 Exp(const Int256& x);

// ============================================================================
// Roots & Means
// ============================================================================

/// Fixed-point square root: floor(sqrt(x * 1e18))
UInt256 Sqrt(const UInt256& x);

/**
 * Geometric mean floor(sqrt(a * b)).
 *
 * This integer square root is the definition every price is computed with.
 * Exp((Ln(a) + Ln(b)) / 2) approximates it to about 1e-12 relative, not to
 * the last unit, and is never used for pricing.
 *
 * The product must fit in 256 bits. Zero if either operand is zero.
 * Symmetric in its arguments.
 */
UInt256 GeometricMean(const UInt256& a, const UInt256& b);

// ============================================================================
// Formatting
// ============================================================================

/// Render a fixed-point value with `decimals` fractional digits ("40.5")
std::string ToDecimalString(const UInt256& value, unsigned decimals = FIXED_DECIMALS);

} // namespace math
} // namespace nebula

#endif // NEBULA_MATH_FIXED_POINT_H
