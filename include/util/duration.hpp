#pragma once

#include <chrono>
#include <string>

namespace sw::util {

using Duration = std::chrono::nanoseconds;

// Parses a Go-style duration string such as "300ms", "1.5h" or "2h45m".
// Valid units are "ns", "us" (or "µs"), "ms", "s", "m", "h". Throws std::invalid_argument.
Duration parseDuration(const std::string& str);

// Renders a duration the way Go's time.Duration prints it, e.g. "5m0s", "1h0m0s", "1.5s", "500ms".
std::string durationToString(Duration d);

template <typename Rep, typename Period>
std::string durationToString(const std::chrono::duration<Rep, Period>& d) {
    return durationToString(std::chrono::duration_cast<Duration>(d));
}

}
