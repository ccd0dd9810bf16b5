#pragma once

#include <string>

namespace dronefleet {

std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Formats a double with a fixed number of decimals ("%.*f").
std::string format_fixed(double v, int decimals);

} // namespace dronefleet
