#ifndef PREDEX_UINT256_HPP
#define PREDEX_UINT256_HPP

#include <utility>

#include "types.hpp"

namespace predex {

// =============================================================================
// U256 - 256-bit unsigned integer as two U128 limbs
//
// Used for curve integrals and the AMM invariant, where products of two
// 18-decimal quantities exceed 128 bits.
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    constexpr U256() : lo(0), hi(0) {}
    constexpr U256(U128 l) : lo(l), hi(0) {}
    constexpr U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const { return lo == other.lo && hi == other.hi; }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>(const U256& other) const { return other < *this; }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }

    bool is_zero() const { return lo == 0 && hi == 0; }
    bool fits_u128() const { return hi == 0; }

    int bit_length() const {
        U128 top = hi != 0 ? hi : lo;
        int bits = hi != 0 ? 128 : 0;
        while (top != 0) {
            top >>= 1;
            ++bits;
        }
        return bits;
    }
};

namespace u256 {

inline U256 add(const U256& a, const U256& b) {
    U256 r;
    r.lo = a.lo + b.lo;
    U128 carry = r.lo < a.lo ? 1 : 0;
    r.hi = a.hi + b.hi + carry;
    if (r.hi < a.hi || (carry && r.hi == a.hi)) {
        throw MarketError(errors::MATH_OVERFLOW, "u256 add overflow");
    }
    return r;
}

// Caller guarantees a >= b
inline U256 sub(const U256& a, const U256& b) {
    if (a < b) {
        throw MarketError(errors::MATH_OVERFLOW, "u256 sub underflow");
    }
    U256 r;
    r.lo = a.lo - b.lo;
    U128 borrow = a.lo < b.lo ? 1 : 0;
    r.hi = a.hi - b.hi - borrow;
    return r;
}

inline U256 shl(const U256& a, unsigned n) {
    if (n == 0) return a;
    if (n >= 256) return U256{};
    if (n >= 128) return U256{0, a.lo << (n - 128)};
    return U256{a.lo << n, (a.hi << n) | (a.lo >> (128 - n))};
}

inline U256 shr(const U256& a, unsigned n) {
    if (n == 0) return a;
    if (n >= 256) return U256{};
    if (n >= 128) return U256{a.hi >> (n - 128), 0};
    return U256{(a.lo >> n) | (a.hi << (128 - n)), a.hi >> n};
}

// Full 128x128 -> 256 product
inline U256 mul(U128 a, U128 b) {
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// 256x128 product, throws when the result needs more than 256 bits
inline U256 mul(const U256& a, U128 b) {
    U256 low = mul(a.lo, b);
    U256 high = mul(a.hi, b);
    if (high.hi != 0) {
        throw MarketError(errors::MATH_OVERFLOW, "u256 mul overflow");
    }
    U256 r{low.lo, low.hi + high.lo};
    if (r.hi < low.hi) {
        throw MarketError(errors::MATH_OVERFLOW, "u256 mul overflow");
    }
    return r;
}

// Quotient and remainder by shift-subtract long division
inline std::pair<U256, U256> divmod(const U256& num, const U256& den) {
    if (den.is_zero()) {
        throw MarketError(errors::MATH_OVERFLOW, "u256 division by zero");
    }
    if (num < den) return {U256{}, num};
    if (num.fits_u128() && den.fits_u128()) {
        return {U256{num.lo / den.lo}, U256{num.lo % den.lo}};
    }

    int shift = num.bit_length() - den.bit_length();
    U256 divisor = shl(den, static_cast<unsigned>(shift));
    U256 rem = num;
    U256 quot;

    for (int i = shift; i >= 0; --i) {
        quot = shl(quot, 1);
        if (rem >= divisor) {
            rem = sub(rem, divisor);
            quot.lo |= 1;
        }
        divisor = shr(divisor, 1);
    }
    return {quot, rem};
}

inline U256 div(const U256& num, const U256& den) {
    return divmod(num, den).first;
}

inline U128 to_u128(const U256& v) {
    if (!v.fits_u128()) {
        throw MarketError(errors::MATH_OVERFLOW, "value exceeds 128 bits");
    }
    return v.lo;
}

inline I128 to_i128(const U256& v) {
    U128 narrowed = to_u128(v);
    if (narrowed > (~U128(0) >> 1)) {
        throw MarketError(errors::MATH_OVERFLOW, "value exceeds signed 128 bits");
    }
    return static_cast<I128>(narrowed);
}

// floor(sqrt(x)) via Newton iteration from an upper bound
inline U128 isqrt(const U256& x) {
    if (x.is_zero()) return 0;

    unsigned half_bits = static_cast<unsigned>((x.bit_length() + 1) / 2);
    U256 y = shl(U256{1}, half_bits);   // y >= sqrt(x)
    while (true) {
        U256 z = shr(add(y, div(x, y)), 1);
        if (z >= y) break;
        y = z;
    }
    return to_u128(y);
}

} // namespace u256

} // namespace predex

#endif // PREDEX_UINT256_HPP
