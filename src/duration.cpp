#include "duration.hh"
#include "macros.hh"
#include "zarr.common.hh"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_map>

using namespace std::chrono_literals;

namespace {
const std::unordered_map<std::string, cf2zarr::Duration>&
unit_table()
{
    static const std::unordered_map<std::string, cf2zarr::Duration> table{
        { "w", 7 * 24h },       { "week", 7 * 24h },
        { "weeks", 7 * 24h },   { "d", 24h },
        { "day", 24h },         { "days", 24h },
        { "h", 1h },            { "hr", 1h },
        { "hour", 1h },         { "hours", 1h },
        { "m", 1min },          { "t", 1min },
        { "min", 1min },        { "minute", 1min },
        { "minutes", 1min },    { "s", 1s },
        { "sec", 1s },          { "second", 1s },
        { "seconds", 1s },      { "ms", 1ms },
        { "l", 1ms },           { "millisecond", 1ms },
        { "milliseconds", 1ms }, { "us", 1us },
        { "u", 1us },           { "microsecond", 1us },
        { "microseconds", 1us }, { "ns", 1ns },
        { "n", 1ns },           { "nanosecond", 1ns },
        { "nanoseconds", 1ns },
    };
    return table;
}

std::string
to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

class DurationParser
{
  public:
    explicit DurationParser(std::string_view text)
      : text_(text)
      , pos_(0)
    {
    }

    cf2zarr::Duration parse()
    {
        skip_spaces_();

        long double sign = 1.0L;
        if (peek_() == '-' || peek_() == '+') {
            sign = next_() == '-' ? -1.0L : 1.0L;
        }

        const long double total =
          (peek_() == 'P' || peek_() == 'p') ? parse_iso_() : parse_pandas_();

        const long double ns = std::round(sign * total);
        if (ns > static_cast<long double>(std::numeric_limits<int64_t>::max()) ||
            ns < static_cast<long double>(std::numeric_limits<int64_t>::min())) {
            fail_("out of range");
        }

        return cf2zarr::Duration(static_cast<int64_t>(ns));
    }

  private:
    std::string_view text_;
    size_t pos_;

    [[noreturn]] void fail_(std::string_view reason) const
    {
        const std::string err =
          LOG_ERROR("Invalid duration '", text_, "': ", reason);
        throw cf2zarr::InvalidSettingsError(err);
    }

    bool done_() const { return pos_ >= text_.size(); }
    char peek_() const { return done_() ? '\0' : text_[pos_]; }
    char next_() { return done_() ? '\0' : text_[pos_++]; }

    void skip_spaces_()
    {
        while (!done_() && std::isspace(static_cast<unsigned char>(peek_()))) {
            ++pos_;
        }
    }

    long double number_()
    {
        const size_t start = pos_;
        while (!done_() &&
               (std::isdigit(static_cast<unsigned char>(peek_())) ||
                peek_() == '.')) {
            ++pos_;
        }
        if (start == pos_) {
            fail_("expected a number");
        }

        const std::string digits(text_.substr(start, pos_ - start));
        char* end = nullptr;
        const long double value = std::strtold(digits.c_str(), &end);
        if (end != digits.c_str() + digits.size()) {
            fail_("malformed number '" + digits + "'");
        }
        return value;
    }

    std::string word_()
    {
        const size_t start = pos_;
        while (!done_() && std::isalpha(static_cast<unsigned char>(peek_()))) {
            ++pos_;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    static long double nanos_(cf2zarr::Duration unit)
    {
        return static_cast<long double>(unit.count());
    }

    // P[nW][nD][T[nH][nM][nS]]
    long double parse_iso_()
    {
        ++pos_; // 'P'
        long double total = 0;
        bool in_time = false;
        bool any = false;

        while (!done_()) {
            if (peek_() == 'T' || peek_() == 't') {
                if (in_time) {
                    fail_("repeated 'T'");
                }
                in_time = true;
                ++pos_;
                continue;
            }

            const auto value = number_();
            const char designator =
              static_cast<char>(std::toupper(static_cast<unsigned char>(next_())));
            any = true;

            switch (designator) {
                case 'W':
                    if (in_time) {
                        fail_("weeks in time part");
                    }
                    total += value * nanos_(7 * 24h);
                    break;
                case 'D':
                    if (in_time) {
                        fail_("days in time part");
                    }
                    total += value * nanos_(24h);
                    break;
                case 'H':
                    if (!in_time) {
                        fail_("hours outside time part");
                    }
                    total += value * nanos_(1h);
                    break;
                case 'M':
                    if (!in_time) {
                        fail_("months are not a fixed duration");
                    }
                    total += value * nanos_(1min);
                    break;
                case 'S':
                    if (!in_time) {
                        fail_("seconds outside time part");
                    }
                    total += value * nanos_(1s);
                    break;
                case 'Y':
                    fail_("years are not a fixed duration");
                default:
                    fail_("unknown designator");
            }
        }

        if (!any) {
            fail_("empty duration");
        }
        return total;
    }

    // "1 days 02:00:00", "36h", "1d 12h", "90 min"
    long double parse_pandas_()
    {
        long double total = 0;
        bool any = false;

        skip_spaces_();
        while (!done_()) {
            if (is_clock_()) {
                total += clock_();
                any = true;
                skip_spaces_();
                continue;
            }

            const auto value = number_();
            skip_spaces_();
            const auto unit = to_lower(word_());
            if (unit.empty()) {
                fail_("missing unit");
            }

            const auto& table = unit_table();
            const auto it = table.find(unit);
            if (it == table.end()) {
                fail_("unknown unit '" + unit + "'");
            }

            total += value * nanos_(it->second);
            any = true;

            skip_spaces_();
            if (peek_() == ',') {
                ++pos_;
                skip_spaces_();
            }
        }

        if (!any) {
            fail_("empty duration");
        }
        return total;
    }

    bool is_clock_() const
    {
        size_t i = pos_;
        while (i < text_.size() &&
               std::isdigit(static_cast<unsigned char>(text_[i]))) {
            ++i;
        }
        return i > pos_ && i < text_.size() && text_[i] == ':';
    }

    // HH:MM[:SS[.f]]
    long double clock_()
    {
        const auto hours = number_();
        if (next_() != ':') {
            fail_("malformed clock");
        }
        const auto minutes = number_();
        long double seconds = 0;
        if (peek_() == ':') {
            ++pos_;
            seconds = number_();
        }

        return hours * nanos_(1h) + minutes * nanos_(1min) +
               seconds * nanos_(1s);
    }
};
} // namespace

cf2zarr::Duration
cf2zarr::parse_duration(std::string_view text)
{
    const auto trimmed = trim(text);
    EXPECT_T(!trimmed.empty(), InvalidSettingsError, "Duration is empty");

    return DurationParser(trimmed).parse();
}

std::string
cf2zarr::format_duration(Duration duration)
{
    std::ostringstream ss;

    auto count = duration.count();
    if (count < 0) {
        ss << '-';
        duration = -duration;
    }

    const auto days = std::chrono::duration_cast<std::chrono::days>(duration);
    duration -= days;
    const auto hours = std::chrono::duration_cast<std::chrono::hours>(duration);
    duration -= hours;
    const auto minutes =
      std::chrono::duration_cast<std::chrono::minutes>(duration);
    duration -= minutes;
    const auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(duration);
    duration -= seconds;

    ss << days.count() << " days " << std::setfill('0') << std::setw(2)
       << hours.count() << ':' << std::setw(2) << minutes.count() << ':'
       << std::setw(2) << seconds.count();

    if (duration.count() != 0) {
        ss << '.' << std::setw(9) << duration.count();
    }

    return ss.str();
}

std::optional<cf2zarr::Duration>
cf2zarr::cf_time_unit(std::string_view units)
{
    auto text = to_lower(trim(units));
    if (const auto since = text.find(" since "); since != std::string::npos) {
        text = text.substr(0, since);
    }

    static const std::unordered_map<std::string, Duration> cf_units{
        { "weeks", 7 * 24h },       { "week", 7 * 24h },
        { "days", 24h },            { "day", 24h },
        { "d", 24h },               { "hours", 1h },
        { "hour", 1h },             { "hr", 1h },
        { "h", 1h },                { "minutes", 1min },
        { "minute", 1min },         { "min", 1min },
        { "seconds", 1s },          { "second", 1s },
        { "sec", 1s },              { "s", 1s },
        { "milliseconds", 1ms },    { "millisecond", 1ms },
        { "ms", 1ms },              { "microseconds", 1us },
        { "microsecond", 1us },     { "us", 1us },
        { "nanoseconds", 1ns },     { "nanosecond", 1ns },
        { "ns", 1ns },
    };

    const auto it = cf_units.find(trim(text));
    if (it == cf_units.end()) {
        return std::nullopt;
    }

    return it->second;
}

namespace {
// Y-M-D[( |T)H:M[:S[.f]]][ ][Z|UTC|(+|-)HH[:][MM]]
class EpochParser
{
  public:
    explicit EpochParser(std::string_view text)
      : text_(text)
      , pos_(0)
    {
    }

    std::optional<cf2zarr::CfTimeUnits> parse(cf2zarr::Duration tick)
    {
        using namespace std::chrono;

        int64_t y, m, d;
        bool negative_year = false;
        if (peek_() == '-') {
            negative_year = true;
            ++pos_;
        }
        if (!integer_(y) || !expect_('-') || !integer_(m) || !expect_('-') ||
            !integer_(d)) {
            return std::nullopt;
        }
        if (negative_year) {
            y = -y;
        }
        if (y < static_cast<int>(year::min()) ||
            y > static_cast<int>(year::max())) {
            return std::nullopt;
        }

        const year_month_day ymd{ year(static_cast<int>(y)),
                                  month(static_cast<unsigned>(m)),
                                  day(static_cast<unsigned>(d)) };
        if (!ymd.ok()) {
            return std::nullopt;
        }

        cf2zarr::Duration time_of_day{ 0 };
        if (peek_() == 'T' || peek_() == 't' ||
            (peek_() == ' ' && is_digit_(pos_ + 1))) {
            ++pos_;
            if (!clock_(time_of_day)) {
                return std::nullopt;
            }
        }

        while (peek_() == ' ') {
            ++pos_;
        }

        cf2zarr::Duration offset{ 0 };
        if (!zone_(offset)) {
            return std::nullopt;
        }

        while (peek_() == ' ') {
            ++pos_;
        }
        if (!done_()) {
            return std::nullopt;
        }

        return cf2zarr::CfTimeUnits{ .tick = tick,
                                     .epoch_day = sys_days(ymd),
                                     .epoch_time = time_of_day - offset };
    }

  private:
    std::string_view text_;
    size_t pos_;

    bool done_() const { return pos_ >= text_.size(); }
    char peek_() const { return done_() ? '\0' : text_[pos_]; }

    bool is_digit_(size_t i) const
    {
        return i < text_.size() &&
               std::isdigit(static_cast<unsigned char>(text_[i]));
    }

    bool expect_(char c)
    {
        if (peek_() != c) {
            return false;
        }
        ++pos_;
        return true;
    }

    bool integer_(int64_t& value, size_t max_digits = 9)
    {
        const size_t start = pos_;
        value = 0;
        while (is_digit_(pos_) && pos_ - start < max_digits) {
            value = value * 10 + (text_[pos_] - '0');
            ++pos_;
        }
        return pos_ > start;
    }

    bool clock_(cf2zarr::Duration& time_of_day)
    {
        using namespace std::chrono;

        int64_t h, m, sec = 0;
        if (!integer_(h, 2) || !expect_(':') || !integer_(m, 2)) {
            return false;
        }

        nanoseconds fraction{ 0 };
        if (peek_() == ':') {
            ++pos_;
            if (!integer_(sec, 2)) {
                return false;
            }
            if (peek_() == '.') {
                ++pos_;
                int64_t scale = 100000000;
                if (!is_digit_(pos_)) {
                    return false;
                }
                while (is_digit_(pos_)) {
                    fraction += nanoseconds((text_[pos_] - '0') * scale);
                    scale /= 10;
                    ++pos_;
                }
            }
        }

        if (h > 24 || m > 59 || sec > 60) {
            return false;
        }

        time_of_day = hours(h) + minutes(m) + seconds(sec) + fraction;
        return true;
    }

    bool zone_(cf2zarr::Duration& offset)
    {
        using namespace std::chrono;

        if (done_()) {
            return true;
        }

        if (peek_() == 'Z' || peek_() == 'z') {
            ++pos_;
            return true;
        }

        if (text_.substr(pos_, 3) == "UTC" || text_.substr(pos_, 3) == "utc") {
            pos_ += 3;
            if (peek_() != '+' && peek_() != '-') {
                return true;
            }
        }

        if (peek_() != '+' && peek_() != '-') {
            return false;
        }
        const bool negative = text_[pos_++] == '-';

        int64_t h, m = 0;
        if (!integer_(h, 2)) {
            return false;
        }
        if (peek_() == ':') {
            ++pos_;
        }
        if (is_digit_(pos_) && !integer_(m, 2)) {
            return false;
        }
        if (h > 14 || m > 59) {
            return false;
        }

        offset = hours(h) + minutes(m);
        if (negative) {
            offset = -offset;
        }
        return true;
    }
};
} // namespace

std::optional<cf2zarr::CfTimeUnits>
cf2zarr::parse_cf_time_units(std::string_view units)
{
    const auto tick = cf_time_unit(units);
    if (!tick.has_value()) {
        return std::nullopt;
    }

    const auto text = trim(units);
    const auto lowered = to_lower(text);
    const auto since = lowered.find(" since ");
    if (since == std::string::npos) {
        return std::nullopt;
    }

    const auto epoch = trim(std::string_view(text).substr(since + 7));
    return EpochParser(epoch).parse(*tick);
}

cf2zarr::Duration
cf2zarr::elapsed(int64_t first, int64_t last, Duration tick)
{
    EXPECT(last >= first, "Ordinal ", last, " is before ", first);

    // exact in uint64 for any first <= last
    const auto steps =
      static_cast<uint64_t>(last) - static_cast<uint64_t>(first);
    if (steps > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return Duration::max();
    }

    const auto ns = checked_mul(static_cast<int64_t>(steps), tick.count());
    return ns.has_value() ? Duration(*ns) : Duration::max();
}

int64_t
cf2zarr::to_ticks(Duration duration, Duration tick)
{
    EXPECT(tick.count() > 0, "Tick must be positive");

    const auto d = duration.count();
    const auto t = tick.count();

    auto q = d / t;
    if (d % t != 0 && d < 0) {
        --q;
    }
    return q;
}
