// rational.h
// Exact rational arithmetic for hypercharges and anomaly coefficients
//
// Rational = boost::multiprecision cpp_rational with expression templates off,
// so `auto` results are plain values.
//
// Text forms:
//   "1/6", "-2/3", "3"   -> numerator/denominator
//   "0.5", "-1.25e-1"     -> exact decimal
// Output follows the same convention: "n/d", or "n" when d == 1.

#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <string>
#include <stdexcept>
#include <cctype>
#include <cstdint>

using Integer  = boost::multiprecision::number<boost::multiprecision::cpp_int_backend<>,
                                               boost::multiprecision::et_off>;
using Rational = boost::multiprecision::number<boost::multiprecision::cpp_rational_backend,
                                               boost::multiprecision::et_off>;

inline Rational make_rational(const Integer& num, const Integer& den) {
    if (den == 0) throw std::invalid_argument("Rational with zero denominator");
    return Rational(num, den);
}

inline Rational make_rational(long long num, long long den = 1) {
    return make_rational(Integer(num), Integer(den));
}

inline std::string rational_str(const Rational& q) {
    Integer num = boost::multiprecision::numerator(q);
    Integer den = boost::multiprecision::denominator(q);
    if (den == 1) return num.str();
    return num.str() + "/" + den.str();
}

inline double rational_to_double(const Rational& q) {
    return q.convert_to<double>();
}

inline Rational rational_pow(const Rational& q, int p) {
    Rational r = 1;
    for (int i = 0; i < p; i++) r *= q;
    return r;
}

inline Rational rational_abs(const Rational& q) {
    return q < 0 ? Rational(-q) : q;
}

// ============================================================================
// Parsing
// ============================================================================

namespace rational_detail {

inline std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

// [+-]digits
inline bool is_integer_text(const std::string& s) {
    size_t i = (!s.empty() && (s[0] == '+' || s[0] == '-')) ? 1 : 0;
    if (i >= s.size()) return false;
    for (; i < s.size(); i++)
        if (!std::isdigit((unsigned char)s[i])) return false;
    return true;
}

inline Integer parse_integer(const std::string& s) {
    if (!is_integer_text(s)) throw std::invalid_argument("Cannot parse integer from: '" + s + "'");
    return Integer((s[0] == '+' ? s.substr(1) : s).c_str());
}

inline Integer pow10(int e) {
    Integer r = 1;
    for (int i = 0; i < e; i++) r *= 10;
    return r;
}

constexpr int kMaxDecimalExponent = 999;

// [+-]digits[.digits][(e|E)[+-]digits], |exponent| <= kMaxDecimalExponent
inline Rational parse_decimal(const std::string& s) {
    std::string mant = s, expo;
    size_t epos = s.find_first_of("eE");
    if (epos != std::string::npos) {
        mant = s.substr(0, epos);
        expo = s.substr(epos + 1);
    }
    std::string sign;
    if (!mant.empty() && (mant[0] == '+' || mant[0] == '-')) {
        if (mant[0] == '-') sign = "-";
        mant = mant.substr(1);
    }
    size_t dot = mant.find('.');
    std::string ip = mant.substr(0, dot);
    std::string fp = (dot == std::string::npos) ? "" : mant.substr(dot + 1);
    if (ip.empty() && fp.empty()) throw std::invalid_argument("Cannot parse fraction from: '" + s + "'");
    std::string digits = ip + fp;
    for (char c : digits)
        if (!std::isdigit((unsigned char)c)) throw std::invalid_argument("Cannot parse fraction from: '" + s + "'");

    Integer num = parse_integer(sign + digits);
    int scale = -(int)fp.size();
    if (!expo.empty()) {
        if (!is_integer_text(expo) || expo.size() > 6)
            throw std::invalid_argument("Cannot parse fraction from: '" + s + "'");
        int e = std::stoi(expo);
        if (e > kMaxDecimalExponent || e < -kMaxDecimalExponent)
            throw std::invalid_argument("Exponent out of range in: '" + s + "'");
        scale += e;
    }
    if (scale >= 0) return Rational(num * pow10(scale));
    return make_rational(num, pow10(-scale));
}

}  // namespace rational_detail

inline Rational parse_rational(const std::string& text) {
    std::string s = rational_detail::trim(text);
    if (s.empty()) throw std::invalid_argument("Cannot parse fraction from empty string");
    size_t slash = s.find('/');
    if (slash != std::string::npos) {
        Integer num = rational_detail::parse_integer(rational_detail::trim(s.substr(0, slash)));
        Integer den = rational_detail::parse_integer(rational_detail::trim(s.substr(slash + 1)));
        return make_rational(num, den);
    }
    if (rational_detail::is_integer_text(s)) return Rational(rational_detail::parse_integer(s));
    return rational_detail::parse_decimal(s);
}
