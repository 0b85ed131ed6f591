#include "mdns_scan/scan_task.hpp"
#include "mdns_scan/errors.hpp"
#include "mdns_scan/log.hpp"

#include <atomic>
#include <thread>
#include <type_traits>

#include <fmt/format.h>

namespace mdns_scan
{

std::string HostNameFromRecordName(const std::string& name)
{
    if (!name.empty() && name.back() == '.') {
        return name.substr(0, name.size() - 1);
    }
    return name;
}

std::vector<AddressBinding> ExtractBindings(const Response& response)
{
    std::vector<AddressBinding> batch;
    for (const auto& record : response.AnswerRecords()) {
        std::visit([&batch](const auto& rec) {
            using T = std::decay_t<decltype(rec)>;
            if constexpr (std::is_same_v<T, ARecord> || std::is_same_v<T, AAAARecord>) {
                batch.emplace_back(IpAddress(rec.address), HostNameFromRecordName(rec.header.name));
            }
        }, record);
    }
    return batch;
}

class ScanTask::ScanTaskImpl
{
private:
    std::string m_query;
    std::shared_ptr<RecordStore> m_store;
    ScanSettings m_settings;

    std::unique_ptr<DiscoverySession> m_session;
    std::atomic<bool> m_started{false};
    std::atomic<bool> m_cancelled{false};
    std::atomic<bool> m_running{false};
    std::atomic<std::size_t> m_responsesProcessed{0};
    std::thread m_listenThread;

public:
    ScanTaskImpl(std::string query, std::shared_ptr<RecordStore> store, ScanSettings settings)
    : m_query(std::move(query))
    , m_store(std::move(store))
    , m_settings(settings)
    {}

    ~ScanTaskImpl()
    {
        Cancel();
    }

    void Start(DiscoveryBackend& backend)
    {
        if (m_started.exchange(true, std::memory_order_acq_rel) == true) {
            Log(LogLevel::Info, fmt::format("Scan for '{}' already started.", m_query));
            return;
        }

        try {
            m_session = backend.OpenSession(m_query, m_settings.query_interval);
        } catch (const SessionOpenError& e) {
            Log(LogLevel::Error, fmt::format("Failed to open discovery session for '{}': {}", m_query, e.what()));
            throw;
        }
        if (!m_session) {
            Log(LogLevel::Error, fmt::format("No discovery session for '{}'.", m_query));
            throw SessionOpenError("Discovery backend returned no session.", m_query);
        }

        Log(LogLevel::Info, fmt::format("Scanning for '{}'.", m_query));
        m_running.store(true, std::memory_order_release);
        m_listenThread = std::thread([this](){
            ListenLoop();
        });
    }

    void Cancel()
    {
        if (m_cancelled.exchange(true, std::memory_order_acq_rel) == false) {
            Log(LogLevel::Debug, fmt::format("Cancelling scan for '{}'.", m_query));
        }

        if (m_listenThread.joinable()) {
            m_listenThread.join();
            Log(LogLevel::Info, fmt::format("Scan for '{}' stopped after {} responses.", m_query, m_responsesProcessed.load()));
        }
        m_session.reset();
    }

    [[nodiscard]] bool Running() const {
        return m_running.load(std::memory_order_acquire);
    }

    const std::string& Query() const {
        return m_query;
    }

    std::size_t ResponsesProcessed() const {
        return m_responsesProcessed.load(std::memory_order_acquire);
    }

protected:
    void ListenLoop()
    {
        try {
            while (!m_cancelled.load(std::memory_order_acquire)) {
                std::optional<Response> response;
                try {
                    response = m_session->Next(m_settings.poll_interval);
                } catch (const ResponseError& e) {
                    Log(LogLevel::Warn, fmt::format("Skipping response for '{}': {}", m_query, e.what()));
                    continue;
                }

                if (!response || m_cancelled.load(std::memory_order_acquire)) {
                    continue;
                }

                const auto batch = ExtractBindings(*response);
                if (!batch.empty()) {
                    m_store->Apply(batch);
                    Log(LogLevel::Debug, fmt::format("Applied {} binding{} from {}", batch.size(), batch.size() > 1 ? "s" : "", response->FromAddress()));
                }
                m_responsesProcessed.fetch_add(1, std::memory_order_acq_rel);
            }
        } catch (const std::exception& e) {
            Log(LogLevel::Error, fmt::format("Scan for '{}' failed: {}", m_query, e.what()));
        }

        // Close the sockets on this thread so Cancel() returns with them released
        m_session.reset();
        m_running.store(false, std::memory_order_release);
    }
};

ScanTask::ScanTask(std::string query, std::shared_ptr<RecordStore> store, ScanSettings settings)
: m_impl(std::make_unique<ScanTaskImpl>(std::move(query), std::move(store), settings))
{}

ScanTask::~ScanTask() = default;

void ScanTask::Start(DiscoveryBackend& backend)
{
    m_impl->Start(backend);
}

void ScanTask::Cancel()
{
    m_impl->Cancel();
}

bool ScanTask::Running() const
{
    return m_impl->Running();
}

const std::string& ScanTask::Query() const
{
    return m_impl->Query();
}

std::size_t ScanTask::ResponsesProcessed() const
{
    return m_impl->ResponsesProcessed();
}

}
