#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mdns_scan/discovery.hpp"
#include "mdns_scan/record_store.hpp"
#include "mdns_scan/scan_task.hpp"
#include "mdns_scan/settings.hpp"

namespace mdns_scan
{

// Owns the one live scan. Not thread safe, drive it from the foreground loop.
class ScanController
{
public:
    ScanController(std::shared_ptr<RecordStore> store,
                   std::shared_ptr<DiscoveryBackend> backend,
                   ScanSettings settings = ScanSettings());
    ~ScanController();

    ScanController(const ScanController&) = delete;
    ScanController& operator=(const ScanController&) = delete;

    // Retires the current scan, clears the store and scans for query.
    // Throws SessionOpenError; the store stays empty and no scan runs.
    void Start(const std::string& query);

    // Cancels and waits for the current scan. Safe to call more than once.
    void Shutdown();

    [[nodiscard]] bool Scanning() const;
    std::optional<std::string> ActiveQuery() const;

    const std::shared_ptr<RecordStore>& Store() const { return m_store; }

private:
    std::shared_ptr<RecordStore> m_store;
    std::shared_ptr<DiscoveryBackend> m_backend;
    ScanSettings m_settings;
    std::unique_ptr<ScanTask> m_current;
};

}
