#include "util/duration.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <fmt/format.h>

namespace sw::util {

namespace {

constexpr uint64_t NS  = 1;
constexpr uint64_t US  = 1000 * NS;
constexpr uint64_t MS  = 1000 * US;
constexpr uint64_t SEC = 1000 * MS;
constexpr uint64_t MIN = 60 * SEC;
constexpr uint64_t HR  = 60 * MIN;

constexpr uint64_t MAX_NS = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

bool isDigit(const char c) { return c >= '0' && c <= '9'; }

uint64_t unitFor(const std::string_view unit) {
    if (unit == "ns") return NS;
    if (unit == "us") return US;
    if (unit == "\xC2\xB5s") return US;  // U+00B5 micro sign
    if (unit == "\xCE\xBCs") return US;  // U+03BC greek mu
    if (unit == "ms") return MS;
    if (unit == "s") return SEC;
    if (unit == "m") return MIN;
    if (unit == "h") return HR;
    return 0;
}

// Writes the lowest `prec` digits of v as a fraction, trimming trailing zeros; v becomes v / 10^prec.
std::string takeFraction(uint64_t& v, const int prec) {
    std::string digits;
    bool print = false;
    for (int i = 0; i < prec; ++i) {
        const auto digit = static_cast<char>(v % 10);
        print = print || digit != 0;
        if (print) digits.insert(digits.begin(), static_cast<char>('0' + digit));
        v /= 10;
    }
    if (print) digits.insert(digits.begin(), '.');
    return digits;
}

}

Duration parseDuration(const std::string& str) {
    const auto invalid = [&str](const std::string_view reason) {
        return std::invalid_argument(fmt::format("invalid duration \"{}\": {}", str, reason));
    };

    std::string_view s = str;
    bool neg = false;
    if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
        neg = s.front() == '-';
        s.remove_prefix(1);
    }

    if (s == "0") return Duration::zero();
    if (s.empty()) throw invalid("empty");

    uint64_t total = 0;
    while (!s.empty()) {
        uint64_t whole = 0;
        size_t i = 0;
        for (; i < s.size() && isDigit(s[i]); ++i) {
            if (whole > (MAX_NS - 9) / 10) throw invalid("overflow");
            whole = whole * 10 + static_cast<uint64_t>(s[i] - '0');
        }
        const bool hasWhole = i > 0;
        s.remove_prefix(i);

        uint64_t frac = 0;
        double scale = 1.0;
        bool hasFrac = false;
        if (!s.empty() && s.front() == '.') {
            s.remove_prefix(1);
            for (i = 0; i < s.size() && isDigit(s[i]); ++i) {
                // excess precision is dropped
                if (frac > (MAX_NS - 9) / 10) continue;
                frac = frac * 10 + static_cast<uint64_t>(s[i] - '0');
                scale *= 10;
            }
            hasFrac = i > 0;
            s.remove_prefix(i);
        }

        if (!hasWhole && !hasFrac) throw invalid("expected a number");

        for (i = 0; i < s.size() && s[i] != '.' && !isDigit(s[i]); ++i) {}
        if (i == 0) throw invalid("missing unit");

        const auto unitName = s.substr(0, i);
        s.remove_prefix(i);

        const auto unit = unitFor(unitName);
        if (unit == 0) throw invalid(fmt::format("unknown unit \"{}\"", unitName));

        if (whole > MAX_NS / unit) throw invalid("overflow");
        whole *= unit;

        if (frac > 0) {
            whole += static_cast<uint64_t>(static_cast<double>(frac) * (static_cast<double>(unit) / scale));
            if (whole > MAX_NS) throw invalid("overflow");
        }

        total += whole;
        if (total > MAX_NS) throw invalid("overflow");
    }

    const auto signedTotal = static_cast<int64_t>(total);
    return Duration(neg ? -signedTotal : signedTotal);
}

std::string durationToString(const Duration d) {
    if (d == Duration::zero()) return "0s";

    const bool neg = d.count() < 0;
    uint64_t u = neg ? static_cast<uint64_t>(-(d.count() + 1)) + 1 : static_cast<uint64_t>(d.count());

    std::string out;
    if (u < SEC) {
        if (u < US) out = fmt::format("{}ns", u);
        else if (u < MS) {
            const auto frac = takeFraction(u, 3);
            out = fmt::format("{}{}\xC2\xB5s", u, frac);
        } else {
            const auto frac = takeFraction(u, 6);
            out = fmt::format("{}{}ms", u, frac);
        }
    } else {
        const auto frac = takeFraction(u, 9);
        out = fmt::format("{}{}s", u % 60, frac);
        u /= 60;
        if (u > 0) {
            out = fmt::format("{}m{}", u % 60, out);
            u /= 60;
            if (u > 0) out = fmt::format("{}h{}", u, out);
        }
    }

    return neg ? "-" + out : out;
}

}
