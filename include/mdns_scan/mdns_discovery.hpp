#pragma once

#include <memory>
#include <string>

#include "mdns_scan/discovery.hpp"
#include "mdns_scan/settings.hpp"

namespace mdns_scan
{

// Discovery over mdns.h client sockets, one per multicast capable interface
// and address family. Sends a PTR query for the service and resends it every
// query interval.
class MdnsDiscoveryBackend : public DiscoveryBackend
{
public:
    explicit MdnsDiscoveryBackend(ScanSettings settings = ScanSettings());

    std::unique_ptr<DiscoverySession> OpenSession(const std::string& query,
                                                  std::chrono::milliseconds query_interval) override;

private:
    ScanSettings m_settings;
};

}
