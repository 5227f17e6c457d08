/**
 * @file Coerce.cpp
 * @brief Implementation of the scalar coercion matrix
 */

#include "morph/Coerce.hpp"
#include "morph/Log.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

namespace morph {
namespace coerce {

namespace {
    std::int64_t int_min(int bits) {
        return bits >= 64 ? std::numeric_limits<std::int64_t>::min()
                          : -(std::int64_t{1} << (bits - 1));
    }

    std::int64_t int_max(int bits) {
        return bits >= 64 ? std::numeric_limits<std::int64_t>::max()
                          : (std::int64_t{1} << (bits - 1)) - 1;
    }

    std::uint64_t uint_max(int bits) {
        return bits >= 64 ? std::numeric_limits<std::uint64_t>::max()
                          : (std::uint64_t{1} << bits) - 1;
    }

    void note_weak(const Value& in, const TypeInfo& target) {
        logger()->debug("weak conversion of {} {} to {}", kind_name(in), display(in), target.name());
    }

    Unconvertible out_of_range(const Value& in, const TypeInfo& target) {
        return Unconvertible("cannot convert '" + display(in) + "' to " + target.name() +
                             ": value out of range");
    }

    Unconvertible unparsable(const Value& in, const TypeInfo& target, const char* what) {
        return Unconvertible("cannot parse '" + display(in) + "' as " + target.name() + ": " + what);
    }

    /**
     * @brief Split off an integer prefix and return its base
     */
    int detect_base(std::string& digits) {
        if (digits.size() > 2 && digits[0] == '0') {
            const char p = digits[1];
            if (p == 'x' || p == 'X') { digits.erase(0, 2); return 16; }
            if (p == 'o' || p == 'O') { digits.erase(0, 2); return 8; }
            if (p == 'b' || p == 'B') { digits.erase(0, 2); return 2; }
        }
        if (digits.size() > 1 && digits[0] == '0') {
            digits.erase(0, 1);
            return 8;
        }
        return 10;
    }

    bool parse_magnitude(std::string digits, std::uint64_t& out) {
        if (digits.empty()) return false;
        const int base = detect_base(digits);
        if (digits.empty()) return false;

        const char* first = digits.data();
        const char* last = first + digits.size();
        auto [ptr, ec] = std::from_chars(first, last, out, base);
        return ec == std::errc() && ptr == last;
    }

    /**
     * @brief Convert a finite double to int64 by truncation
     * @return false if the truncated value is outside the 64-bit range
     */
    bool truncate(double value, std::int64_t& out) {
        const double t = std::trunc(value);
        // 2^63 is exactly representable; anything at or above it does not fit
        if (t < -9223372036854775808.0 || t >= 9223372036854775808.0) return false;
        out = static_cast<std::int64_t>(t);
        return true;
    }

    bool truncate(double value, std::uint64_t& out) {
        const double t = std::trunc(value);
        if (t < 0.0 || t >= 18446744073709551616.0) return false;
        out = static_cast<std::uint64_t>(t);
        return true;
    }

    /**
     * @brief Parse a decimal float; an optional leading '+' is accepted, whitespace is not
     *
     * Values too small to represent become a signed zero. Values too large fail.
     */
    bool parse_double(const std::string& text, double& out) {
        const char* first = text.data();
        const char* last = first + text.size();
        if (first != last && *first == '+') {
            ++first;
            if (first != last && *first == '-') return false;
        }
        if (first == last) return false;

        auto [ptr, ec] = std::from_chars(first, last, out);
        if (ptr != last) return false;
        if (ec == std::errc::result_out_of_range) {
            const auto exp = text.find_first_of("eE");
            if (exp == std::string::npos || exp + 1 >= text.size() || text[exp + 1] != '-') {
                return false;
            }
            out = *first == '-' ? -0.0 : 0.0;
            return true;
        }
        return ec == std::errc();
    }

    /**
     * @brief Finite values must fit the target width
     */
    double fit(double value, const Value& in, const FloatType& target) {
        if (target.bits() == 32 && std::isfinite(value) &&
            std::fabs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
            throw out_of_range(in, target);
        }
        return value;
    }
}

std::string display(const Value& in) {
    switch (kind_of(in)) {
        case ValueKind::String:
            return in.get_ref<const std::string&>();
        case ValueKind::Bytes:
            return std::string(in.get_binary().begin(), in.get_binary().end());
        case ValueKind::Nil:
            return "<nil>";
        default:
            return in.dump();
    }
}

Unconvertible mismatch(const Value& in, const TypeInfo& target) {
    return Unconvertible("expected type '" + target.name() + "', got unconvertible type '" +
                         kind_name(in) + "', value: '" + display(in) + "'");
}

bool parse_int(const std::string& text, std::int64_t& out) {
    if (text.empty()) return false;

    bool negative = false;
    std::string digits = text;
    if (digits[0] == '+' || digits[0] == '-') {
        negative = digits[0] == '-';
        digits.erase(0, 1);
    }

    std::uint64_t magnitude = 0;
    if (!parse_magnitude(digits, magnitude)) return false;

    constexpr auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative) {
        if (magnitude > limit + 1) return false;
        out = magnitude == limit + 1 ? std::numeric_limits<std::int64_t>::min()
                                     : -static_cast<std::int64_t>(magnitude);
    } else {
        if (magnitude > limit) return false;
        out = static_cast<std::int64_t>(magnitude);
    }
    return true;
}

bool parse_uint(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text[0] == '+' || text[0] == '-') return false;
    return parse_magnitude(text, out);
}

bool parse_bool(const std::string& text, bool& out) {
    if (text == "1" || text == "t" || text == "T" || text == "TRUE" || text == "true" || text == "True") {
        out = true;
        return true;
    }
    if (text == "0" || text == "f" || text == "F" || text == "FALSE" || text == "false" || text == "False") {
        out = false;
        return true;
    }
    return false;
}

bool to_bool(const Value& in, const BoolType& target, bool weak) {
    switch (kind_of(in)) {
        case ValueKind::Bool:
            return in.get<bool>();

        case ValueKind::Int64:
        case ValueKind::Uint64:
        case ValueKind::Float64:
            if (!weak) break;
            note_weak(in, target);
            return in.get<double>() != 0.0;

        case ValueKind::String: {
            if (!weak) break;
            note_weak(in, target);
            const auto& text = in.get_ref<const std::string&>();
            if (text.empty()) return false;
            bool out = false;
            if (!parse_bool(text, out)) {
                throw unparsable(in, target, "invalid syntax");
            }
            return out;
        }

        default:
            break;
    }
    throw mismatch(in, target);
}

std::int64_t to_int(const Value& in, const IntType& target, bool weak) {
    const int bits = target.bits();
    std::int64_t out = 0;

    switch (kind_of(in)) {
        case ValueKind::Int64:
            out = in.get<std::int64_t>();
            if (out < int_min(bits) || out > int_max(bits)) {
                if (!weak) throw out_of_range(in, target);
                note_weak(in, target);
            }
            return out;

        case ValueKind::Uint64: {
            const auto u = in.get<std::uint64_t>();
            out = static_cast<std::int64_t>(u);
            if (u > static_cast<std::uint64_t>(int_max(bits))) {
                if (!weak) throw out_of_range(in, target);
                note_weak(in, target);
            }
            return out;
        }

        case ValueKind::Float64: {
            const double f = in.get<double>();
            if (!std::isfinite(f) || !truncate(f, out)) {
                throw out_of_range(in, target);
            }
            if (out < int_min(bits) || out > int_max(bits)) {
                if (!weak) throw out_of_range(in, target);
                note_weak(in, target);
            }
            return out;
        }

        case ValueKind::Bool:
            if (!weak) break;
            note_weak(in, target);
            return in.get<bool>() ? 1 : 0;

        case ValueKind::String: {
            if (!weak) break;
            note_weak(in, target);
            const auto& text = in.get_ref<const std::string&>();
            if (text.empty()) return 0;
            if (!parse_int(text, out)) {
                throw unparsable(in, target, "invalid syntax or value out of range");
            }
            if (out < int_min(bits) || out > int_max(bits)) {
                throw out_of_range(in, target);
            }
            return out;
        }

        default:
            break;
    }
    throw mismatch(in, target);
}

std::uint64_t to_uint(const Value& in, const UintType& target, bool weak) {
    const int bits = target.bits();
    std::uint64_t out = 0;

    switch (kind_of(in)) {
        case ValueKind::Int64: {
            const auto i = in.get<std::int64_t>();
            out = static_cast<std::uint64_t>(i);
            if (i < 0 || out > uint_max(bits)) {
                if (!weak) throw out_of_range(in, target);
                note_weak(in, target);
            }
            return out;
        }

        case ValueKind::Uint64:
            out = in.get<std::uint64_t>();
            if (out > uint_max(bits)) {
                if (!weak) throw out_of_range(in, target);
                note_weak(in, target);
            }
            return out;

        case ValueKind::Float64: {
            const double f = in.get<double>();
            if (!std::isfinite(f)) {
                throw out_of_range(in, target);
            }
            if (f < 0.0) {
                // Negative floats only reach unsigned targets by wrapping
                std::int64_t wrapped = 0;
                if (!weak || !truncate(f, wrapped)) throw out_of_range(in, target);
                note_weak(in, target);
                return static_cast<std::uint64_t>(wrapped);
            }
            if (!truncate(f, out)) {
                throw out_of_range(in, target);
            }
            if (out > uint_max(bits)) {
                if (!weak) throw out_of_range(in, target);
                note_weak(in, target);
            }
            return out;
        }

        case ValueKind::Bool:
            if (!weak) break;
            note_weak(in, target);
            return in.get<bool>() ? 1 : 0;

        case ValueKind::String: {
            if (!weak) break;
            note_weak(in, target);
            const auto& text = in.get_ref<const std::string&>();
            if (text.empty()) return 0;
            if (!parse_uint(text, out)) {
                throw unparsable(in, target, "invalid syntax or value out of range");
            }
            if (out > uint_max(bits)) {
                throw out_of_range(in, target);
            }
            return out;
        }

        default:
            break;
    }
    throw mismatch(in, target);
}

double to_float(const Value& in, const FloatType& target, bool weak) {
    switch (kind_of(in)) {
        case ValueKind::Float64:
        case ValueKind::Int64:
        case ValueKind::Uint64:
            return fit(in.get<double>(), in, target);

        case ValueKind::Bool:
            if (!weak) break;
            note_weak(in, target);
            return in.get<bool>() ? 1.0 : 0.0;

        case ValueKind::String: {
            if (!weak) break;
            note_weak(in, target);
            const auto& text = in.get_ref<const std::string&>();
            if (text.empty()) return 0.0;
            double out = 0.0;
            if (!parse_double(text, out)) {
                throw unparsable(in, target, "invalid syntax or value out of range");
            }
            return fit(out, in, target);
        }

        default:
            break;
    }
    throw mismatch(in, target);
}

std::string to_string(const Value& in, const TypeInfo& target, bool weak) {
    switch (kind_of(in)) {
        case ValueKind::String:
            return in.get<std::string>();

        case ValueKind::Bytes:
            return display(in);

        case ValueKind::Bool:
            if (!weak) break;
            note_weak(in, target);
            return in.get<bool>() ? "1" : "0";

        case ValueKind::Int64:
            if (!weak) break;
            note_weak(in, target);
            return std::to_string(in.get<std::int64_t>());

        case ValueKind::Uint64:
            if (!weak) break;
            note_weak(in, target);
            return std::to_string(in.get<std::uint64_t>());

        case ValueKind::Float64:
            if (!weak) break;
            note_weak(in, target);
            return fmt::format("{}", in.get<double>());

        default:
            break;
    }
    throw mismatch(in, target);
}

std::vector<std::uint8_t> to_bytes(const Value& in, const TypeInfo& target) {
    if (in.is_binary()) {
        const auto& bin = in.get_binary();
        return std::vector<std::uint8_t>(bin.begin(), bin.end());
    }
    if (in.is_string()) {
        const auto& text = in.get_ref<const std::string&>();
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }
    throw mismatch(in, target);
}

} // namespace coerce
} // namespace morph
