#include "mdns_scan/settings.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

namespace mdns_scan
{

std::chrono::milliseconds ParseSeconds(const std::string& text, std::chrono::milliseconds max)
{
    double seconds = 0;
    std::size_t used = 0;
    try {
        seconds = std::stod(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(fmt::format("'{}' is not a number of seconds", text));
    }
    if (used != text.size() || !std::isfinite(seconds)) {
        throw std::invalid_argument(fmt::format("'{}' is not a number of seconds", text));
    }

    const double maxSeconds = max.count() / 1000.0;
    if (seconds <= 0 || seconds > maxSeconds) {
        throw std::invalid_argument(fmt::format("Seconds must be above 0 and at most {}, got '{}'", maxSeconds, text));
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000));
}

}
