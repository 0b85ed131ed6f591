#include "mdns_scan/mdns_discovery.hpp"
#include "mdns_scan/errors.hpp"
#include "mdns_scan/log.hpp"
#include "mdns_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <deque>
#include <system_error>

#include <sys/select.h>

#include <fmt/format.h>

namespace mdns_scan
{

class MdnsDiscoverySession : public DiscoverySession
{
public:
    MdnsDiscoverySession(std::string query, std::chrono::milliseconds query_interval, const ScanSettings& settings)
    : m_query(std::move(query))
    , m_queryInterval(query_interval)
    , m_buffer(std::max<std::size_t>(settings.receive_buffer_size, 512))
    {
        m_sockets = OpenClientSockets(0, settings.max_sockets);
        const auto num_sockets = m_sockets.size();
        if (num_sockets == 0) {
            Log(LogLevel::Error, "Failed to open any client sockets.");
            throw SessionOpenError("Failed to open any client sockets.", m_query);
        }
        Log(LogLevel::Info, fmt::format("Opened {} socket{} for mDNS query {}.", num_sockets, num_sockets > 1 ? "s" : "", m_query));

        if (SendQuery() == 0) {
            CloseSockets();
            throw SessionOpenError(fmt::format("Failed to send mDNS query: {}", strerror(m_sendError)), m_query);
        }
    }

    ~MdnsDiscoverySession() override
    {
        CloseSockets();
    }

    std::optional<Response> Next(std::chrono::milliseconds max_wait) override
    {
        if (!m_pending.empty()) {
            return PopPending();
        }

        if (std::chrono::steady_clock::now() - m_lastQuery >= m_queryInterval) {
            if (SendQuery() == 0) {
                Log(LogLevel::Warn, fmt::format("Failed to resend mDNS query {}: {}", m_query, strerror(m_sendError)));
            }
        }

        int nfds = 0;
        fd_set readfs;
        FD_ZERO(&readfs);
        for (const auto& sock : m_sockets) {
            if (sock >= nfds)
                nfds = sock + 1;
            FD_SET(sock, &readfs);
        }

        struct timeval timeout;
        timeout.tv_sec = static_cast<long>(max_wait.count() / 1000);
        timeout.tv_usec = static_cast<long>((max_wait.count() % 1000) * 1000);

        const int numberOfReadyDescriptors = select(nfds, &readfs, nullptr, nullptr, &timeout);
        if (numberOfReadyDescriptors < 0) {
            if (errno == EINTR) {
                return std::nullopt;
            }
            throw std::system_error(errno, std::generic_category(), "select on mDNS sockets failed");
        }

        std::size_t undecodable = 0;
        if (numberOfReadyDescriptors > 0) {
            for (const auto& sock : m_sockets) {
                if (!FD_ISSET(sock, &readfs)) {
                    continue;
                }
                auto response = ReceiveResponse(sock, m_buffer.data(), m_buffer.size());
                if (response.Empty()) {
                    ++undecodable;
                } else {
                    m_pending.push_back(std::move(response));
                }
            }
        }

        if (!m_pending.empty()) {
            return PopPending();
        }
        if (undecodable > 0) {
            throw ResponseError(fmt::format("{} packet{} without resource records", undecodable, undecodable > 1 ? "s" : ""));
        }
        return std::nullopt;
    }

private:
    // Returns the number of sockets the query went out on
    std::size_t SendQuery()
    {
        const auto sent = SendPtrQuery(m_sockets, m_query, m_buffer.data(), m_buffer.size(), m_sendError);
        m_lastQuery = std::chrono::steady_clock::now();
        Log(LogLevel::Debug, fmt::format("Sent mDNS query {} on {} of {} sockets.", m_query, sent, m_sockets.size()));
        return sent;
    }

    Response PopPending()
    {
        Response response = std::move(m_pending.front());
        m_pending.pop_front();
        return response;
    }

    void CloseSockets()
    {
        for (const auto& sock : m_sockets) {
            mdns_socket_close(sock);
        }
        if (!m_sockets.empty()) {
            Log(LogLevel::Debug, fmt::format("Closed sockets for mDNS query {}.", m_query));
        }
        m_sockets.clear();
    }

    std::string m_query;
    std::chrono::milliseconds m_queryInterval;
    std::vector<char> m_buffer;
    std::vector<int> m_sockets;
    std::chrono::steady_clock::time_point m_lastQuery;
    int m_sendError{0};
    std::deque<Response> m_pending;
};

MdnsDiscoveryBackend::MdnsDiscoveryBackend(ScanSettings settings)
: m_settings(settings)
{}

std::unique_ptr<DiscoverySession> MdnsDiscoveryBackend::OpenSession(const std::string& query,
                                                                    std::chrono::milliseconds query_interval)
{
    return std::make_unique<MdnsDiscoverySession>(NormalizeQuery(query), query_interval, m_settings);
}

}
