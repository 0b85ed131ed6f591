#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace mdns_scan
{

struct ScanSettings
{
    // The query is sent again after this long so the session keeps listening
    std::chrono::milliseconds query_interval{std::chrono::seconds(5)};
    // Longest wait for a response before the cancel flag is checked again
    std::chrono::milliseconds poll_interval{100};
    std::size_t max_sockets{32};
    std::size_t receive_buffer_size{2048};
};

// Reads a positive, finite number of seconds no larger than max, e.g. "2.5".
// Throws std::invalid_argument otherwise.
std::chrono::milliseconds ParseSeconds(const std::string& text, std::chrono::milliseconds max);

}
