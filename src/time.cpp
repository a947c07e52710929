#include "aiblame/time.hpp"
#include "aiblame/util.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace aiblame::timeutil {

namespace {

// "+HHMM" for the local zone at `t`.
std::string local_zone(std::time_t t) {
  std::tm lt{};
  localtime_r(&t, &lt);
  const long east = lt.tm_gmtoff / 60;
  const long m = east < 0 ? -east : east;
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%c%02ld%02ld", east < 0 ? '-' : '+', m / 60, m % 60);
  return buf;
}

} // namespace

std::string signature_now(const Identity &id) {
  const std::time_t now = std::time(nullptr);
  return id.name + " <" + id.email + "> " + std::to_string(static_cast<long long>(now)) + " " +
         local_zone(now);
}

std::optional<std::int64_t> signature_epoch(std::string_view sig) {
  // The epoch sits after the closing '>' of the email.
  const auto gt = sig.rfind('>');
  if (gt == std::string_view::npos) return std::nullopt;
  auto rest = sig.substr(gt + 1);
  while (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
  const auto sp = rest.find(' ');
  long long t = 0;
  if (!strutil::parse_int(rest.substr(0, sp), t)) return std::nullopt;
  return t;
}

std::int64_t now_millis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace aiblame::timeutil
