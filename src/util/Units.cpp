#include "util/Units.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

#include "util/AsciiLower.hpp"

namespace vigil::util {

struct UnitDef { const char* name; double mult; };

static constexpr double kK = 1000.0, kKi = 1024.0;
static constexpr UnitDef kByteUnits[] = {
  {"b",   1.0},
  {"kb",  kK},  {"mb",  kK*kK},   {"gb",  kK*kK*kK},   {"tb",  kK*kK*kK*kK},   {"pb",  kK*kK*kK*kK*kK},
  {"kib", kKi}, {"mib", kKi*kKi}, {"gib", kKi*kKi*kKi}, {"tib", kKi*kKi*kKi*kKi}, {"pib", kKi*kKi*kKi*kKi*kKi},
};

std::optional<double> byte_unit_multiplier(std::string_view unit) {
  if (unit.empty()) return std::nullopt;
  for (const auto& u : kByteUnits) {
    if (ascii_iequals(unit, u.name)) return u.mult;
  }
  return std::nullopt;
}

std::string format_bytes(double bytes) {
  if (!std::isfinite(bytes) || bytes < 0) bytes = 0;
  static constexpr const char* suffix[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
  int idx = 0;
  double v = bytes;
  while (v >= 1024.0 && idx < 5) { v /= 1024.0; ++idx; }
  std::ostringstream os;
  if (idx == 0) os << static_cast<uint64_t>(v + 0.5) << suffix[0];
  else { os.setf(std::ios::fixed); os << std::setprecision(1) << v << suffix[idx]; }
  return os.str();
}

std::string format_rate(double bytes_per_sec) { return format_bytes(bytes_per_sec) + "/s"; }

std::optional<TempUnit> parse_temp_unit(std::string_view s) {
  if (ascii_iequals(s, "c") || ascii_iequals(s, "celsius")) return TempUnit::Celsius;
  if (ascii_iequals(s, "f") || ascii_iequals(s, "fahrenheit")) return TempUnit::Fahrenheit;
  if (ascii_iequals(s, "k") || ascii_iequals(s, "kelvin")) return TempUnit::Kelvin;
  return std::nullopt;
}

const char* temp_unit_name(TempUnit u) {
  switch (u) {
    case TempUnit::Celsius: return "celsius";
    case TempUnit::Fahrenheit: return "fahrenheit";
    case TempUnit::Kelvin: return "kelvin";
  }
  return "celsius";
}

double convert_celsius(double celsius, TempUnit to) {
  switch (to) {
    case TempUnit::Celsius: return celsius;
    case TempUnit::Fahrenheit: return celsius * 9.0 / 5.0 + 32.0;
    case TempUnit::Kelvin: return celsius + 273.15;
  }
  return celsius;
}

} // namespace vigil::util
