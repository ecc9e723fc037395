#pragma once
#include <chrono>
#include <functional>
#include <string>

namespace ranger {

/// Source of "now"; replaced in tests to pin timestamps.
using Clock = std::function<std::chrono::system_clock::time_point()>;

Clock system_clock();

/// Local time as "YYYY-MM-DDTHH:MM:SS.ffffff".
std::string format_iso8601(std::chrono::system_clock::time_point tp);

} // namespace ranger
