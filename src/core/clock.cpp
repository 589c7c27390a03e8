#include "devflow/core/clock.h"

#include <array>
#include <cstddef>
#include <ctime>

namespace devflow::core {

namespace {

bool read_digits(const std::string_view text, const std::size_t pos, const std::size_t width,
                 int& out) {
  if (pos + width > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
    value = value * 10 + (text[i] - '0');
  }
  out = value;
  return true;
}

}  // namespace

std::string format_utc(const Instant instant) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(instant);
  std::tm parts{};
  gmtime_r(&seconds, &parts);

  std::array<char, 32> buffer{};
  const auto written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &parts);
  return {buffer.data(), written};
}

std::optional<Instant> parse_iso8601(const std::string_view text) {
  using namespace std::chrono;

  int y = 0;
  int mo = 0;
  int d = 0;
  if (!read_digits(text, 0, 4, y) || text.size() < 10 || text[4] != '-' ||
      !read_digits(text, 5, 2, mo) || text[7] != '-' || !read_digits(text, 8, 2, d)) {
    return std::nullopt;
  }
  const year_month_day date{year{y}, month{static_cast<unsigned>(mo)},
                            day{static_cast<unsigned>(d)}};
  // Keeps the nanosecond arithmetic inside system_clock's range.
  if (!date.ok() || y < 1700 || y > 2200) {
    return std::nullopt;
  }
  if (text.size() == 10) {
    return Instant{sys_days{date}};
  }

  int h = 0;
  int mi = 0;
  int sec = 0;
  const char sep = text[10];
  if ((sep != 'T' && sep != 't' && sep != ' ') || !read_digits(text, 11, 2, h) ||
      text.size() < 19 || text[13] != ':' || !read_digits(text, 14, 2, mi) || text[16] != ':' ||
      !read_digits(text, 17, 2, sec) || h > 23 || mi > 59 || sec > 60) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  nanoseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    const std::size_t start = pos;
    long long scale = 100000000;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      fraction += nanoseconds{(text[pos] - '0') * scale};
      scale /= 10;
      ++pos;
    }
    if (pos == start) {
      return std::nullopt;
    }
  }

  minutes offset{0};
  if (pos < text.size()) {
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      int oh = 0;
      int om = 0;
      std::size_t minute_pos = pos + 3;
      if (minute_pos < text.size() && text[minute_pos] == ':') {
        ++minute_pos;
      }
      if (!read_digits(text, pos + 1, 2, oh) || !read_digits(text, minute_pos, 2, om) ||
          oh > 23 || om > 59) {
        return std::nullopt;
      }
      offset = hours{oh} + minutes{om};
      if (zone == '-') {
        offset = -offset;
      }
      pos = minute_pos + 2;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  const nanoseconds since_epoch = sys_days{date}.time_since_epoch() + hours{h} + minutes{mi} +
                                  seconds{sec} + fraction - offset;
  return Instant{duration_cast<Instant::duration>(since_epoch)};
}

}  // namespace devflow::core
