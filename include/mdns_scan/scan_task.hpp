#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mdns_scan/binding_set.hpp"
#include "mdns_scan/discovery.hpp"
#include "mdns_scan/record_store.hpp"
#include "mdns_scan/settings.hpp"

namespace mdns_scan
{

// A/AAAA records of a response as bindings, in wire order. Everything else is skipped.
std::vector<AddressBinding> ExtractBindings(const Response& response);

// Host name of a record without the trailing root label dot
std::string HostNameFromRecordName(const std::string& name);

// Listens for responses to one query on a background thread and feeds the
// store until cancelled.
class ScanTask
{
public:
    ScanTask(std::string query, std::shared_ptr<RecordStore> store, ScanSettings settings = ScanSettings());
    ~ScanTask();

    ScanTask(const ScanTask&) = delete;
    ScanTask& operator=(const ScanTask&) = delete;

    // Opens the session on the calling thread, then starts listening.
    // Throws SessionOpenError, in which case nothing runs.
    void Start(DiscoveryBackend& backend);

    // Returns once the listen thread has exited and the session is closed.
    // Safe to call more than once.
    void Cancel();

    [[nodiscard]] bool Running() const;
    const std::string& Query() const;
    std::size_t ResponsesProcessed() const;

private:
    class ScanTaskImpl;
    std::unique_ptr<ScanTaskImpl> m_impl;
};

}
