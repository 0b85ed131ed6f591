#pragma once

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mdns_scan
{

enum class AddressFamily {
    IPv4,
    IPv6
};
std::string ToString(AddressFamily family);

struct Ipv4Address {
    std::array<std::uint8_t, 4> octets{};
};
bool operator==(const Ipv4Address& lhs, const Ipv4Address& rhs);
bool operator!=(const Ipv4Address& lhs, const Ipv4Address& rhs);
bool operator<(const Ipv4Address& lhs, const Ipv4Address& rhs);
std::ostream& operator<<(std::ostream& os, const Ipv4Address& address);

struct Ipv6Address {
    std::array<std::uint8_t, 16> octets{};
};
bool operator==(const Ipv6Address& lhs, const Ipv6Address& rhs);
bool operator!=(const Ipv6Address& lhs, const Ipv6Address& rhs);
bool operator<(const Ipv6Address& lhs, const Ipv6Address& rhs);
std::ostream& operator<<(std::ostream& os, const Ipv6Address& address);

// The index of the alternative is the address family
using IpAddress = std::variant<Ipv4Address, Ipv6Address>;

AddressFamily FamilyOf(const IpAddress& address);
std::string ToString(const Ipv4Address& address);
std::string ToString(const Ipv6Address& address);
std::string ToString(const IpAddress& address);
std::ostream& operator<<(std::ostream& os, const IpAddress& address);

// Accepts dotted IPv4 or textual IPv6, without port or scope
std::optional<IpAddress> ParseIpAddress(std::string_view text);


// From mdns.h mdns_record_type
enum class RecordType {
    PTR = 12, // Domain name pointer
    SRV = 33, // Server Selection [RFC2782]
    TXT = 16, // Arbitrary text string
    A = 1, // Address
    AAAA = 28, // IP6 Address [Thomson]
    ANY = 255 // Any available records
};

enum class EntryType {
    UNKNOWN,
    QUESTION,
    ANSWER,
    AUTHORITY,
    ADDITIONAL
};
std::string ToString(EntryType entry);

struct RecordHeader {
    std::string from_address; // Sender of the response, possibly including port
    EntryType entry_type{EntryType::UNKNOWN};
    std::string name; // example: "printer.local."

    std::uint16_t record_type{0}; // Value may not be in RecordType!
    std::uint16_t rclass{0};
    std::uint32_t ttl{0};
    std::size_t record_length{0};
};
std::ostream& operator<<(std::ostream& os, const RecordHeader& header);

struct DomainNamePointerRecord {
    RecordHeader header;

    std::string target; // example: "printer._ipp._tcp.local."
};
std::ostream& operator<<(std::ostream& os, const DomainNamePointerRecord& record);

struct ServiceRecord {
    RecordHeader header;

    std::string target;
    std::uint16_t priority{0};
    std::uint16_t weight{0};
    std::uint16_t port{0};
};
std::ostream& operator<<(std::ostream& os, const ServiceRecord& record);

struct ARecord {
    RecordHeader header;

    Ipv4Address address;
};
std::ostream& operator<<(std::ostream& os, const ARecord& record);

struct AAAARecord {
    RecordHeader header;

    Ipv6Address address;
};
std::ostream& operator<<(std::ostream& os, const AAAARecord& record);

struct TXTRecord {
    RecordHeader header;

    std::vector<std::pair<std::string, std::string>> txt;
};
std::ostream& operator<<(std::ostream& os, const TXTRecord& record);

struct AnyRecord {
    RecordHeader header;
};
std::ostream& operator<<(std::ostream& os, const AnyRecord& record);

using Record = std::variant<DomainNamePointerRecord,
                            ServiceRecord,
                            ARecord,
                            AAAARecord,
                            TXTRecord,
                            AnyRecord>;
std::ostream& operator<<(std::ostream& os, const Record& record);

// One received mDNS packet, in the order the records appeared on the wire
class Response
{
public:
    Response() = default;
    explicit Response(std::string from_address, std::vector<Record> records = {});

    const std::string& FromAddress() const { return m_fromAddress; }
    void SetFromAddress(std::string from_address) { m_fromAddress = std::move(from_address); }

    // Every resource record of the answer, authority and additional sections
    const std::vector<Record>& AnswerRecords() const { return m_records; }

    void AddRecord(Record record);
    [[nodiscard]] bool Empty() const { return m_records.empty(); }

private:
    std::string m_fromAddress;
    std::vector<Record> m_records;
};

}
