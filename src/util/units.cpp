#include "util/units.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>

namespace xfer {

namespace {

std::string Lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

struct UnitScale {
    const char* suffix;
    std::uint64_t factor;
};

constexpr std::array<UnitScale, 7> kDurationUnits{{
    {"ms", 1ULL},
    {"s", 1000ULL},
    {"sec", 1000ULL},
    {"m", 60ULL * 1000},
    {"min", 60ULL * 1000},
    {"h", 60ULL * 60 * 1000},
    {"d", 24ULL * 60 * 60 * 1000},
}};

constexpr std::array<UnitScale, 10> kSizeUnits{{
    {"", 1ULL},
    {"b", 1ULL},
    {"kb", 1000ULL},
    {"mb", 1000ULL * 1000},
    {"gb", 1000ULL * 1000 * 1000},
    {"tb", 1000ULL * 1000 * 1000 * 1000},
    {"kib", 1ULL << 10},
    {"mib", 1ULL << 20},
    {"gib", 1ULL << 30},
    {"tib", 1ULL << 40},
}};

} // namespace

std::expected<std::chrono::milliseconds, std::string> ParseDuration(std::string_view s) {
    const std::string in = Lower(Trim(s));
    if (in.empty()) return std::unexpected("empty duration");

    std::uint64_t total_ms = 0;
    size_t pos = 0;
    while (pos < in.size()) {
        std::uint64_t value = 0;
        const auto [num_end, ec] = std::from_chars(in.data() + pos, in.data() + in.size(), value);
        if (ec != std::errc()) return std::unexpected("invalid duration: " + in);
        pos = static_cast<size_t>(num_end - in.data());

        size_t unit_end = pos;
        while (unit_end < in.size() && std::isalpha(static_cast<unsigned char>(in[unit_end]))) ++unit_end;
        const std::string unit = in.substr(pos, unit_end - pos);
        pos = unit_end;

        std::uint64_t factor = 0;
        if (unit.empty()) {
            if (pos != in.size() || total_ms != 0) return std::unexpected("missing unit in duration: " + in);
            factor = 1000;
        }
        for (const auto& u : kDurationUnits) {
            if (unit == u.suffix) factor = u.factor;
        }
        if (factor == 0) return std::unexpected("unknown duration unit '" + unit + "'");

        if (value > (std::numeric_limits<std::uint64_t>::max() - total_ms) / factor) {
            return std::unexpected("duration out of range: " + in);
        }
        total_ms += value * factor;
    }

    if (total_ms > static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max())) {
        return std::unexpected("duration out of range: " + in);
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(total_ms));
}

std::expected<std::uint64_t, std::string> ParseByteSize(std::string_view s) {
    const std::string in = Lower(Trim(s));
    if (in.empty()) return std::unexpected("empty size");

    size_t num_end = 0;
    while (num_end < in.size() &&
           (std::isdigit(static_cast<unsigned char>(in[num_end])) || in[num_end] == '.')) {
        ++num_end;
    }
    if (num_end == 0) return std::unexpected("invalid size: " + in);

    double value = 0;
    const auto [ptr, ec] = std::from_chars(in.data(), in.data() + num_end, value);
    if (ec != std::errc() || ptr != in.data() + num_end) return std::unexpected("invalid size: " + in);

    const std::string_view unit = Trim(std::string_view(in).substr(num_end));
    for (const auto& u : kSizeUnits) {
        if (unit == u.suffix) {
            const double bytes = std::floor(value * static_cast<double>(u.factor));
            if (bytes >= 18446744073709551615.0) return std::unexpected("size out of range: " + in);
            return static_cast<std::uint64_t>(bytes);
        }
    }
    return std::unexpected("unknown size unit '" + std::string(unit) + "'");
}

std::string FormatDecimalBytes(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "kB", "MB", "GB", "TB", "PB"};
    if (bytes < 1000) return std::to_string(bytes) + " B";

    double v = static_cast<double>(bytes);
    size_t idx = 0;
    while (v >= 1000.0 && idx + 1 < std::size(kUnits)) {
        v /= 1000.0;
        ++idx;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f %s", v, kUnits[idx]);
    return buf;
}

std::string FormatDuration(std::chrono::milliseconds d) {
    using namespace std::chrono;
    if (d < seconds(1)) return std::to_string(d.count()) + "ms";

    auto rest = duration_cast<seconds>(d);
    const auto days = rest / hours(24);
    rest -= hours(24) * days;
    const auto hrs = duration_cast<hours>(rest);
    rest -= hrs;
    const auto mins = duration_cast<minutes>(rest);
    rest -= mins;

    std::string out;
    auto append = [&out](long long v, const char* unit) {
        if (v == 0) return;
        if (!out.empty()) out += ' ';
        out += std::to_string(v) + unit;
    };
    append(days, "d");
    append(hrs.count(), "h");
    append(mins.count(), "m");
    append(rest.count(), "s");
    return out;
}

} // namespace xfer
