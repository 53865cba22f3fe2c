// src/functions/date_functions.cpp
#include "screenbind/functions/registry.h"
#include "screenbind/common/coerce.h"
#include <chrono>
#include <cstdio>
#include <optional>

namespace screenbind {

namespace {

using namespace std::chrono;
using Timestamp = sys_time<milliseconds>;

class DateScanner {
public:
    explicit DateScanner(std::string_view text) : s_(text) {}

    bool done() const { return pos_ == s_.size(); }
    bool peek(char c) const { return pos_ < s_.size() && s_[pos_] == c; }

    bool eat(char c) {
        if (!peek(c)) return false;
        ++pos_;
        return true;
    }

    // exactly `width` digits
    std::optional<int> digits(std::size_t width) {
        if (pos_ + width > s_.size()) return std::nullopt;
        int v = 0;
        for (std::size_t i = 0; i < width; ++i) {
            char c = s_[pos_ + i];
            if (c < '0' || c > '9') return std::nullopt;
            v = v * 10 + (c - '0');
        }
        pos_ += width;
        return v;
    }

    // Fraction of a second after '.', truncated to milliseconds.
    std::optional<int> fraction_ms() {
        int ms = 0;
        std::size_t count = 0;
        while (pos_ < s_.size() && s_[pos_] >= '0' && s_[pos_] <= '9') {
            if (count < 3) ms = ms * 10 + (s_[pos_] - '0');
            ++count;
            ++pos_;
        }
        if (count == 0) return std::nullopt;
        for (; count < 3; ++count) ms *= 10;
        return ms;
    }

private:
    std::string_view s_;
    std::size_t pos_ = 0;
};

// YYYY[-MM[-DD]][(T| )HH:mm[:ss[.fff]]][Z|+HH:MM|-HHMM]; no offset means UTC.
std::optional<Timestamp> parse_timestamp(std::string_view text) {
    DateScanner in(text);

    auto y = in.digits(4);
    if (!y) return std::nullopt;
    int mo = 1, d = 1;
    if (in.eat('-')) {
        auto m = in.digits(2);
        if (!m) return std::nullopt;
        mo = *m;
        if (in.eat('-')) {
            auto dd = in.digits(2);
            if (!dd) return std::nullopt;
            d = *dd;
        }
    }

    year_month_day ymd{year{*y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;

    int hh = 0, mm = 0, ss = 0, ms = 0;
    int offset_minutes = 0;
    if (in.eat('T') || in.eat(' ')) {
        auto h = in.digits(2);
        if (!h || !in.eat(':')) return std::nullopt;
        auto mi = in.digits(2);
        if (!mi) return std::nullopt;
        hh = *h;
        mm = *mi;
        if (in.eat(':')) {
            auto sec = in.digits(2);
            if (!sec) return std::nullopt;
            ss = *sec;
            if (in.eat('.')) {
                auto frac = in.fraction_ms();
                if (!frac) return std::nullopt;
                ms = *frac;
            }
        }
        if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;

        if (in.eat('Z')) {
            // UTC
        } else if (in.peek('+') || in.peek('-')) {
            int sign = in.peek('-') ? -1 : 1;
            in.eat(sign < 0 ? '-' : '+');
            auto oh = in.digits(2);
            if (!oh) return std::nullopt;
            in.eat(':');
            auto om = in.digits(2);
            if (!om || *oh > 23 || *om > 59) return std::nullopt;
            offset_minutes = sign * (*oh * 60 + *om);
        }
    }
    if (!in.done()) return std::nullopt;

    return Timestamp{sys_days{ymd}} + hours{hh} + minutes{mm - offset_minutes} +
           seconds{ss} + milliseconds{ms};
}

std::string pad2(unsigned v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02u", v);
    return buf;
}

void replace_first(std::string& s, std::string_view token, const std::string& with) {
    auto pos = s.find(token);
    if (pos != std::string::npos) s.replace(pos, token.size(), with);
}

std::string iso_string(Timestamp t) {
    auto day_point = std::chrono::floor<days>(t);
    year_month_day ymd{day_point};
    hh_mm_ss<milliseconds> tod{t - day_point};
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()),
                  static_cast<int>(tod.subseconds().count()));
    return buf;
}

} // namespace

void FunctionRegistry::register_date_functions() {
    register_function("now", {{}, "string", "Current ISO timestamp"},
        [](const std::vector<Value>&) -> Value {
            return iso_string(std::chrono::time_point_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now()));
        });

    register_function("formatDate", {{"date", "format"}, "string", "Format date (YYYY-MM-DD HH:mm:ss)"},
        [](const std::vector<Value>& args) -> Value {
            std::string raw = to_display_string(fn::arg(args, 0));
            auto parsed = parse_timestamp(raw);
            if (!parsed) return raw;

            auto day_point = std::chrono::floor<std::chrono::days>(*parsed);
            std::chrono::year_month_day ymd{day_point};
            std::chrono::hh_mm_ss<std::chrono::milliseconds> tod{*parsed - day_point};

            // each token is replaced once, in this order
            std::string out = to_display_string(fn::arg(args, 1));
            replace_first(out, "YYYY", std::to_string(static_cast<int>(ymd.year())));
            replace_first(out, "MM", pad2(static_cast<unsigned>(ymd.month())));
            replace_first(out, "DD", pad2(static_cast<unsigned>(ymd.day())));
            replace_first(out, "HH", pad2(static_cast<unsigned>(tod.hours().count())));
            replace_first(out, "mm", pad2(static_cast<unsigned>(tod.minutes().count())));
            replace_first(out, "ss", pad2(static_cast<unsigned>(tod.seconds().count())));
            return out;
        });
}

} // namespace screenbind
