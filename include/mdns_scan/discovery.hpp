#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "mdns_scan/types.hpp"

namespace mdns_scan
{

// Checks a service query such as "_http._tcp.local" and returns it with the
// trailing root dot. Throws SessionOpenError when malformed.
std::string NormalizeQuery(const std::string& query);

// An open query. Destroying it releases its sockets. Not restartable.
class DiscoverySession
{
public:
    virtual ~DiscoverySession() = default;

    // Waits at most max_wait for the next response. Returns nullopt on timeout.
    // Throws ResponseError when a received response cannot be decoded.
    virtual std::optional<Response> Next(std::chrono::milliseconds max_wait) = 0;
};

class DiscoveryBackend
{
public:
    virtual ~DiscoveryBackend() = default;

    // Throws SessionOpenError
    virtual std::unique_ptr<DiscoverySession> OpenSession(const std::string& query,
                                                          std::chrono::milliseconds query_interval) = 0;
};

}
