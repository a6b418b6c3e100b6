#pragma once
#include <string>

namespace vessel::core {

// Strip leading and trailing whitespace (space, tab, CR, LF).
std::string trim(const std::string& s);

} // namespace vessel::core
