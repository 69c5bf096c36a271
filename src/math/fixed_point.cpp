// NEBULA - Fixed-Point Arithmetic Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include <nebula/math/fixed_point.h>
#include <nebula/core/errors.h>
#include <nebula/util/logging.h>

#include <boost/multiprecision/integer.hpp>

namespace nebula {
namespace math {

namespace {

const UInt512& MaxWord() {
    static const UInt512 value = UInt512(MaxUInt256());
    return value;
}

/// Narrow a 512-bit intermediate back to a ledger word
UInt256 Narrow(const UInt512& value, OracleErrc onOverflow, const char* op) {
    if (value > MaxWord()) {
        LOG_DEBUG(util::LogCategory::MATH) << op << ": result exceeds 256 bits";
        throw OracleError(onOverflow, op);
    }
    return UInt256(value);
}

/// log2(x / 1e18) in fixed point, for x >= 1e18
UInt256 Log2AtLeastOne(const UInt256& x) {
    // Integer part from the most significant bit of x / 1e18
    unsigned n = boost::multiprecision::msb(UInt256(x / UNIT));
    UInt256 result = UInt256(n) * UNIT;

    // y = x / 2^n is in [1, 2)
    UInt256 y = x >> n;
    if (y == UNIT) {
        return result;
    }

    // Fractional part: square y and emit a bit each time it reaches 2
    const UInt256 doubleUnit = UNIT * 2;
    for (UInt256 delta = UNIT / 2; delta > 0; delta >>= 1) {
        y = (y * y) / UNIT;
        if (y >= doubleUnit) {
            result += delta;
            y >>= 1;
        }
    }
    return result;
}

} // namespace

// ============================================================================
// Arithmetic
// ============================================================================

UInt256 MulDiv(const UInt256& x, const UInt256& y, const UInt256& d) {
    if (d == 0) {
        throw OracleError(OracleErrc::DivisionByZero, "mulDiv");
    }
    UInt512 product = UInt512(x) * UInt512(y);
    return Narrow(product / UInt512(d), OracleErrc::ArithmeticOverflow, "mulDiv");
}

UInt256 Mul(const UInt256& x, const UInt256& y) {
    return MulDiv(x, y, UNIT);
}

UInt256 Div(const UInt256& x, const UInt256& y) {
    if (y == 0) {
        throw OracleError(OracleErrc::DivisionByZero, "div");
    }
    return MulDiv(x, UNIT, y);
}

UInt256 Pow10(unsigned n) {
    if (n > 77) {
        throw OracleError(OracleErrc::ArithmeticOverflow, "pow10");
    }
    return boost::multiprecision::pow(UInt256(10), n);
}

// ============================================================================
// Transcendental
// ============================================================================

Int256 Ln(const UInt256& x) {
    if (x == 0) {
        throw OracleError(OracleErrc::InvalidDomain, "ln of zero");
    }

    // ln(x) = -ln(1/x) below one
    bool negative = x < UNIT;
    UInt256 log2 = negative ? Log2AtLeastOne((UNIT * UNIT) / x)
                            : Log2AtLeastOne(x);

    UInt256 magnitude = (log2 * UNIT) / LOG2_E;
    Int256 result = static_cast<Int256>(magnitude);
    return negative ? Int256(-result) : result;
}

UInt256 Exp(const Int256& x) {
    if (x <= EXP_MIN_INPUT) {
        return 0;
    }
    if (x >= EXP_MAX_INPUT) {
        throw OracleError(OracleErrc::InvalidDomain, "exp input too large");
    }

    const bool negative = x < 0;
    const UInt256 magnitude = static_cast<UInt256>(negative ? Int256(-x) : x);
    const UInt512 unit36 = UInt512(UNIT) * UInt512(UNIT);

    // |x| = k * ln2 + r
    UInt512 x36 = UInt512(magnitude) * UInt512(UNIT);
    UInt512 k = x36 / LN2_36;
    UInt512 r = x36 % LN2_36;

    // e^-|x| = 2^-(k+1) * e^(ln2 - r) keeps the remainder non-negative
    if (negative && r != 0) {
        k += 1;
        r = LN2_36 - r;
    }

    // e^r = sum r^i / i!
    UInt512 sum = unit36;
    UInt512 term = unit36;
    for (unsigned i = 1;; ++i) {
        term = (term * r) / (unit36 * i);
        if (term == 0) {
            break;
        }
        sum += term;
    }

    unsigned shift = k.convert_to<unsigned>();
    UInt512 result = negative ? sum / (UInt512(UNIT) << shift)
                              : (sum << shift) / UInt512(UNIT);
    return Narrow(result, OracleErrc::InvalidDomain, "exp");
}

// ============================================================================
// Roots & Means
// ============================================================================

UInt256 Sqrt(const UInt256& x) {
    UInt512 scaled = UInt512(x) * UInt512(UNIT);
    return UInt256(boost::multiprecision::sqrt(scaled));
}

UInt256 GeometricMean(const UInt256& a, const UInt256& b) {
    if (a == 0 || b == 0) {
        return 0;
    }

    UInt512 product = UInt512(a) * UInt512(b);
    if (product > MaxWord()) {
        LOG_DEBUG(util::LogCategory::MATH) << "geometricMean: product exceeds 256 bits";
        throw OracleError(OracleErrc::ArithmeticOverflow, "geometricMean");
    }
    return UInt256(boost::multiprecision::sqrt(product));
}

// ============================================================================
// Formatting
// ============================================================================

std::string ToDecimalString(const UInt256& value, unsigned decimals) {
    if (decimals == 0) {
        return value.str();
    }

    UInt256 scale = Pow10(decimals);
    std::string integerPart = UInt256(value / scale).str();
    std::string fraction = UInt256(value % scale).str();

    if (fraction == "0") {
        return integerPart;
    }

    fraction.insert(0, decimals - fraction.size(), '0');
    fraction.erase(fraction.find_last_not_of('0') + 1);
    return integerPart + "." + fraction;
}

} // namespace math
} // namespace nebula
