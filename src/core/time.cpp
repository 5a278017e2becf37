#include "pmlink/core/time.h"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace pmlink::core {

namespace {

// Cursor over the input; every read either consumes exactly what it promises or fails.
class Cursor {
 public:
  explicit Cursor(std::string_view text) : text_(text) {}

  [[nodiscard]] bool done() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const { return done() ? '\0' : text_[pos_]; }

  bool consume(const char ch) {
    if (peek() != ch) {
      return false;
    }
    ++pos_;
    return true;
  }

  // Reads exactly `width` decimal digits.
  std::optional<int> digits(const std::size_t width) {
    if (pos_ + width > text_.size()) {
      return std::nullopt;
    }
    int value = 0;
    const char* first = text_.data() + pos_;
    const char* last = first + width;
    for (const char* p = first; p != last; ++p) {
      if (*p < '0' || *p > '9') {
        return std::nullopt;
      }
    }
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
      return std::nullopt;
    }
    pos_ += width;
    return value;
  }

  // Reads one or more digits of a fraction, returning microseconds (truncated).
  std::optional<std::int64_t> fraction_micros() {
    std::int64_t micros = 0;
    std::size_t count = 0;
    while (!done() && peek() >= '0' && peek() <= '9') {
      if (count < 6) {
        micros = micros * 10 + (peek() - '0');
      }
      ++count;
      ++pos_;
    }
    if (count == 0) {
      return std::nullopt;
    }
    for (std::size_t i = count; i < 6; ++i) {
      micros *= 10;
    }
    return micros;
  }

 private:
  std::string_view text_;
  std::size_t pos_{0};
};

// Parses "Z" or a numeric offset. Returns offset in minutes east of UTC.
std::optional<int> parse_offset(Cursor& cur) {
  if (cur.consume('Z') || cur.consume('z')) {
    return 0;
  }

  int sign = 0;
  if (cur.consume('+')) {
    sign = 1;
  } else if (cur.consume('-')) {
    sign = -1;
  } else {
    return std::nullopt;
  }

  const auto hours = cur.digits(2);
  if (!hours.has_value() || *hours > 23) {
    return std::nullopt;
  }

  int minutes = 0;
  if (!cur.done()) {
    cur.consume(':');
    const auto mm = cur.digits(2);
    if (!mm.has_value() || *mm > 59) {
      return std::nullopt;
    }
    minutes = *mm;
  }

  return sign * (*hours * 60 + minutes);
}

}  // namespace

std::optional<Timestamp> parse_iso8601(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  Cursor cur(text);

  const auto year = cur.digits(4);
  if (!year.has_value() || !cur.consume('-')) {
    return std::nullopt;
  }
  const auto month = cur.digits(2);
  if (!month.has_value() || !cur.consume('-')) {
    return std::nullopt;
  }
  const auto day = cur.digits(2);
  if (!day.has_value()) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                        std::chrono::month{static_cast<unsigned>(*month)},
                                        std::chrono::day{static_cast<unsigned>(*day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  std::int64_t micros = 0;
  int offset_minutes = 0;

  if (!cur.done()) {
    if (!cur.consume('T') && !cur.consume('t') && !cur.consume(' ')) {
      return std::nullopt;
    }

    const auto hh = cur.digits(2);
    if (!hh.has_value() || *hh > 23) {
      return std::nullopt;
    }
    hour = *hh;

    if (cur.consume(':')) {
      const auto mm = cur.digits(2);
      if (!mm.has_value() || *mm > 59) {
        return std::nullopt;
      }
      minute = *mm;

      if (cur.consume(':')) {
        const auto ss = cur.digits(2);
        if (!ss.has_value() || *ss > 59) {
          return std::nullopt;
        }
        second = *ss;

        if (cur.consume('.') || cur.consume(',')) {
          const auto frac = cur.fraction_micros();
          if (!frac.has_value()) {
            return std::nullopt;
          }
          micros = *frac;
        }
      }
    }

    if (!cur.done()) {
      const auto offset = parse_offset(cur);
      if (!offset.has_value() || !cur.done()) {
        return std::nullopt;
      }
      offset_minutes = *offset;
    }
  }

  using namespace std::chrono;
  const sys_time<microseconds> local = sys_days{ymd} + hours{hour} + minutes{minute} +
                                       seconds{second} + microseconds{micros};
  const sys_time<microseconds> utc = local - minutes{offset_minutes};
  return time_point_cast<Clock::duration>(utc);
}

std::string format_iso8601(const Timestamp ts) {
  using namespace std::chrono;
  const auto secs = floor<seconds>(ts);
  const auto day_point = floor<days>(secs);
  const year_month_day ymd{day_point};
  const hh_mm_ss<seconds> tod{secs - day_point};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count() << ':'
      << std::setw(2) << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count()
      << 'Z';
  return oss.str();
}

double hours_between(const Timestamp a, const Timestamp b) {
  const auto diff = a > b ? a - b : b - a;
  return std::chrono::duration<double, std::ratio<3600>>(diff).count();
}

}  // namespace pmlink::core
