#include "mdns_scan/scan_controller.hpp"
#include "mdns_scan/log.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace mdns_scan
{

ScanController::ScanController(std::shared_ptr<RecordStore> store,
                               std::shared_ptr<DiscoveryBackend> backend,
                               ScanSettings settings)
: m_store(std::move(store))
, m_backend(std::move(backend))
, m_settings(settings)
{
    if (!m_store || !m_backend) {
        throw std::invalid_argument("ScanController needs a store and a discovery backend.");
    }
}

ScanController::~ScanController()
{
    Shutdown();
}

void ScanController::Start(const std::string& query)
{
    Log(LogLevel::Debug, fmt::format("Scan start requested for '{}'.", query));

    if (m_current) {
        m_current->Cancel();
        m_current.reset();
    }
    m_store->Clear();

    auto task = std::make_unique<ScanTask>(query, m_store, m_settings);
    task->Start(*m_backend);
    m_current = std::move(task);
}

void ScanController::Shutdown()
{
    if (!m_current) {
        return;
    }
    Log(LogLevel::Info, fmt::format("Shutting down scan for '{}'.", m_current->Query()));
    m_current->Cancel();
    m_current.reset();
}

bool ScanController::Scanning() const
{
    return m_current && m_current->Running();
}

std::optional<std::string> ScanController::ActiveQuery() const
{
    if (!m_current) {
        return std::nullopt;
    }
    return m_current->Query();
}

}
