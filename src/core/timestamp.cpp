#include "core/timestamp.hpp"

#include <chrono>
#include <format>

namespace dbsync::timestamp {

namespace {

constexpr int64_t kMicrosPerSecond = 1'000'000;
constexpr int64_t kSecondsPerDay = 86'400;

class Cursor {
public:
    explicit Cursor(std::string_view s) : s_(s) {}

    bool done() const { return pos_ >= s_.size(); }
    char peek() const { return done() ? '\0' : s_[pos_]; }

    bool consume(char c) {
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    // Exactly n decimal digits
    std::optional<int> digits(size_t n) {
        if (pos_ + n > s_.size()) return std::nullopt;
        int v = 0;
        for (size_t i = 0; i < n; ++i) {
            const char c = s_[pos_ + i];
            if (c < '0' || c > '9') return std::nullopt;
            v = v * 10 + (c - '0');
        }
        pos_ += n;
        return v;
    }

private:
    std::string_view s_;
    size_t pos_ = 0;
};

std::optional<int64_t> days_from_date(int y, int m, int d) {
    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
        std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;
    return std::chrono::sys_days{ymd}.time_since_epoch().count();
}

std::optional<int64_t> parse_date(Cursor& c) {
    const auto y = c.digits(4);
    if (!y || !c.consume('-')) return std::nullopt;
    const auto m = c.digits(2);
    if (!m || !c.consume('-')) return std::nullopt;
    const auto d = c.digits(2);
    if (!d) return std::nullopt;
    return days_from_date(*y, *m, *d);
}

} // namespace

std::optional<int64_t> parse_micros(std::string_view text) {
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ') text.remove_suffix(1);

    Cursor c(text);
    const auto days = parse_date(c);
    if (!days) return std::nullopt;

    int64_t seconds = *days * kSecondsPerDay;
    int64_t fraction = 0;

    if (c.done()) return seconds * kMicrosPerSecond;
    if (!c.consume('T') && !c.consume(' ')) return std::nullopt;

    const auto hh = c.digits(2);
    if (!hh || !c.consume(':')) return std::nullopt;
    const auto mm = c.digits(2);
    if (!mm) return std::nullopt;
    int ss = 0;
    if (c.consume(':')) {
        const auto s = c.digits(2);
        if (!s) return std::nullopt;
        ss = *s;
    }
    // 24:00:00 is valid in PostgreSQL input but never in output
    if (*hh > 23 || *mm > 59 || ss > 60) return std::nullopt;

    if (c.consume('.')) {
        int n = 0;
        while (c.peek() >= '0' && c.peek() <= '9') {
            const auto digit = c.digits(1);
            if (n < 6) fraction = fraction * 10 + *digit;
            ++n;
        }
        if (n == 0) return std::nullopt;
        for (int i = n; i < 6; ++i) fraction *= 10;
    }

    seconds += static_cast<int64_t>(*hh) * 3600 + static_cast<int64_t>(*mm) * 60 + ss;

    if (c.consume('Z')) {
        // UTC
    } else if (c.peek() == '+' || c.peek() == '-') {
        const int sign = c.peek() == '+' ? 1 : -1;
        c.consume(c.peek());
        const auto oh = c.digits(2);
        if (!oh) return std::nullopt;
        int om = 0;
        if (c.consume(':')) {
            const auto m2 = c.digits(2);
            if (!m2) return std::nullopt;
            om = *m2;
        } else if (!c.done()) {
            const auto m2 = c.digits(2);
            if (!m2) return std::nullopt;
            om = *m2;
        }
        if (*oh > 15 || om > 59) return std::nullopt;
        seconds -= sign * (static_cast<int64_t>(*oh) * 3600 + static_cast<int64_t>(om) * 60);
    }

    if (!c.done()) return std::nullopt;
    return seconds * kMicrosPerSecond + fraction;
}

std::string format_micros(int64_t micros) {
    int64_t seconds = micros / kMicrosPerSecond;
    int64_t fraction = micros % kMicrosPerSecond;
    if (fraction < 0) {
        fraction += kMicrosPerSecond;
        --seconds;
    }
    int64_t days = seconds / kSecondsPerDay;
    int64_t rem = seconds % kSecondsPerDay;
    if (rem < 0) {
        rem += kSecondsPerDay;
        --days;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::sys_days{std::chrono::days{days}}};

    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:06d}Z",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        static_cast<int>(rem / 3600),
        static_cast<int>((rem % 3600) / 60),
        static_cast<int>(rem % 60),
        static_cast<int>(fraction));
}

std::optional<std::string> normalize(std::string_view text) {
    const auto micros = parse_micros(text);
    if (!micros) return std::nullopt;
    return format_micros(*micros);
}

std::optional<std::string> normalize_date(std::string_view text) {
    Cursor c(text);
    const auto days = parse_date(c);
    if (!days || !c.done()) return std::nullopt;
    return std::string(text);
}

} // namespace dbsync::timestamp
