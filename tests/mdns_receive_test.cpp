#include "mdns_utils.hpp"

#include <cerrno>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <gtest/gtest.h>

using namespace mdns_scan;

namespace
{

using Packet = std::vector<std::uint8_t>;

void Put16(Packet& packet, std::uint16_t value)
{
    packet.push_back(static_cast<std::uint8_t>(value >> 8));
    packet.push_back(static_cast<std::uint8_t>(value & 0xff));
}

void PutName(Packet& packet, const std::string& dotted)
{
    std::size_t begin = 0;
    while (begin < dotted.size()) {
        auto end = dotted.find('.', begin);
        if (end == std::string::npos) {
            end = dotted.size();
        }
        packet.push_back(static_cast<std::uint8_t>(end - begin));
        packet.insert(packet.end(), dotted.begin() + begin, dotted.begin() + end);
        begin = end + 1;
    }
    packet.push_back(0);
}

// Response header with no questions and answer_count answers
Packet ResponseHeader(std::uint16_t answer_count)
{
    Packet packet;
    Put16(packet, 0);
    Put16(packet, 0x8400);
    Put16(packet, 0);
    Put16(packet, answer_count);
    Put16(packet, 0);
    Put16(packet, 0);
    return packet;
}

void PutRecord(Packet& packet, const std::string& name, std::uint16_t type, const Packet& rdata)
{
    PutName(packet, name);
    Put16(packet, type);
    Put16(packet, 0x8001);
    Put16(packet, 0);
    Put16(packet, 120);
    Put16(packet, static_cast<std::uint16_t>(rdata.size()));
    packet.insert(packet.end(), rdata.begin(), rdata.end());
}

// Two UDP sockets on 127.0.0.1, the sender connected to the receiver
class LoopbackPair
{
public:
    LoopbackPair()
    {
        m_receiver = socket(AF_INET, SOCK_DGRAM, 0);
        m_sender = socket(AF_INET, SOCK_DGRAM, 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        m_ready = m_receiver >= 0 && m_sender >= 0
            && bind(m_receiver, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0
            && getsockname(m_receiver, reinterpret_cast<sockaddr*>(&addr), &len) == 0
            && connect(m_sender, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    ~LoopbackPair()
    {
        if (m_receiver >= 0) {
            close(m_receiver);
        }
        if (m_sender >= 0) {
            close(m_sender);
        }
    }

    bool Ready() const { return m_ready; }

    // Sends packet and returns what the receiving side decodes from it
    Response Deliver(const Packet& packet)
    {
        if (send(m_sender, packet.data(), packet.size(), 0) != static_cast<ssize_t>(packet.size())) {
            ADD_FAILURE() << "send failed: " << strerror(errno);
            return {};
        }
        pollfd pfd{m_receiver, POLLIN, 0};
        if (poll(&pfd, 1, 1000) != 1) {
            ADD_FAILURE() << "nothing arrived on the loopback socket";
            return {};
        }
        std::vector<char> buffer(2048);
        return ReceiveResponse(m_receiver, buffer.data(), buffer.size());
    }

private:
    int m_receiver{-1};
    int m_sender{-1};
    bool m_ready{false};
};

}

TEST(ReceiveResponseTest, DecodesAddressRecords)
{
    LoopbackPair pair;
    ASSERT_TRUE(pair.Ready());

    Packet packet = ResponseHeader(2);
    PutRecord(packet, "printer.local", MDNS_RECORDTYPE_A, {10, 0, 0, 5});
    PutRecord(packet, "printer.local", MDNS_RECORDTYPE_AAAA,
              {0xfe, 0x80, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1});

    const auto response = pair.Deliver(packet);
    ASSERT_EQ(response.AnswerRecords().size(), 2u);
    EXPECT_EQ(response.FromAddress().rfind("127.0.0.1:", 0), 0u);

    const auto* a = std::get_if<ARecord>(&response.AnswerRecords()[0]);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->header.name, "printer.local.");
    EXPECT_EQ(a->header.entry_type, EntryType::ANSWER);
    EXPECT_EQ(a->header.ttl, 120u);
    EXPECT_EQ(ToString(a->address), "10.0.0.5");

    const auto* aaaa = std::get_if<AAAARecord>(&response.AnswerRecords()[1]);
    ASSERT_NE(aaaa, nullptr);
    EXPECT_EQ(aaaa->header.name, "printer.local.");
    EXPECT_EQ(ToString(aaaa->address), "fe80::1");
}

TEST(ReceiveResponseTest, ShortAddressRecordIsKeptAsAny)
{
    LoopbackPair pair;
    ASSERT_TRUE(pair.Ready());

    Packet packet = ResponseHeader(1);
    PutRecord(packet, "printer.local", MDNS_RECORDTYPE_A, {10, 0, 0});

    const auto response = pair.Deliver(packet);
    ASSERT_EQ(response.AnswerRecords().size(), 1u);
    const auto* any = std::get_if<AnyRecord>(&response.AnswerRecords()[0]);
    ASSERT_NE(any, nullptr);
    EXPECT_EQ(any->header.record_type, MDNS_RECORDTYPE_A);
    EXPECT_EQ(any->header.record_length, 3u);
}

TEST(ReceiveResponseTest, LogsEachRecordAtDebug)
{
    LoopbackPair pair;
    ASSERT_TRUE(pair.Ready());

    std::vector<std::string> lines;
    SetLogger([&lines](LogLevel level, std::string_view message) {
        if (level == LogLevel::Debug) {
            lines.emplace_back(message);
        }
    }, LogLevel::Debug);

    Packet packet = ResponseHeader(2);
    PutRecord(packet, "printer.local", MDNS_RECORDTYPE_A, {10, 0, 0, 5});
    PutRecord(packet, "printer.local", MDNS_RECORDTYPE_TXT, {5, 'r', 'p', '=', 'i', 'p'});
    pair.Deliver(packet);
    ResetLogger();

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("answer printer.local. A 10.0.0.5"), std::string::npos);
    EXPECT_NE(lines[1].find("TXT"), std::string::npos);
    EXPECT_NE(lines[1].find("rp"), std::string::npos);
}

TEST(ReceiveResponseTest, HeaderOnlyPacketHasNoRecords)
{
    LoopbackPair pair;
    ASSERT_TRUE(pair.Ready());

    EXPECT_TRUE(pair.Deliver(ResponseHeader(0)).Empty());
}

TEST(SendPtrQueryTest, KeepsErrnoOfFailedSend)
{
    // The sink clobbers errno, as a file write may
    SetLogger([](LogLevel, std::string_view) { errno = 0; }, LogLevel::Debug);

    std::vector<char> buffer(512);
    int lastError = 0;
    const auto sent = SendPtrQuery({-1}, "_http._tcp.local.", buffer.data(), buffer.size(), lastError);
    ResetLogger();

    EXPECT_EQ(sent, 0u);
    EXPECT_EQ(lastError, EBADF);
}
