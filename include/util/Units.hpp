#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vigil::util {

// Multiplier for a byte unit suffix, case-insensitive.
// "B" = 1, "KB".."PB" = powers of 1000, "KiB".."PiB" = powers of 1024.
[[nodiscard]] std::optional<double> byte_unit_multiplier(std::string_view unit);

// Binary-scaled labels: "512B", "1.5KiB", "20.0MiB", "3.2GiB"
std::string format_bytes(double bytes);
std::string format_rate(double bytes_per_sec); // format_bytes + "/s"

enum class TempUnit { Celsius, Fahrenheit, Kelvin };

[[nodiscard]] std::optional<TempUnit> parse_temp_unit(std::string_view s);
const char* temp_unit_name(TempUnit u);
double convert_celsius(double celsius, TempUnit to);

} // namespace vigil::util
