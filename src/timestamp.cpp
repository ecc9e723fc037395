#include "ranger/timestamp.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ranger {

Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    const auto since_epoch = tp.time_since_epoch();
    auto secs = duration_cast<seconds>(since_epoch);
    auto micros = duration_cast<microseconds>(since_epoch - secs).count();
    if (micros < 0) {
        micros += 1000000;
        secs -= seconds(1);
    }

    const std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

} // namespace ranger
