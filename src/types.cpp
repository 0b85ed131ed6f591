#include "mdns_scan/types.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstring>

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>


namespace mdns_scan
{

std::string ToString(AddressFamily family)
{
    switch (family) {
        case AddressFamily::IPv4: return "IPv4";
        case AddressFamily::IPv6: return "IPv6";
    }
    return "";
}

bool operator==(const Ipv4Address& lhs, const Ipv4Address& rhs)
{
    return lhs.octets == rhs.octets;
}

bool operator!=(const Ipv4Address& lhs, const Ipv4Address& rhs)
{
    return !(lhs == rhs);
}

bool operator<(const Ipv4Address& lhs, const Ipv4Address& rhs)
{
    return lhs.octets < rhs.octets;
}

std::ostream& operator<<(std::ostream& os, const Ipv4Address& address)
{
    os << ToString(address);
    return os;
}

bool operator==(const Ipv6Address& lhs, const Ipv6Address& rhs)
{
    return lhs.octets == rhs.octets;
}

bool operator!=(const Ipv6Address& lhs, const Ipv6Address& rhs)
{
    return !(lhs == rhs);
}

bool operator<(const Ipv6Address& lhs, const Ipv6Address& rhs)
{
    return lhs.octets < rhs.octets;
}

std::ostream& operator<<(std::ostream& os, const Ipv6Address& address)
{
    os << ToString(address);
    return os;
}

AddressFamily FamilyOf(const IpAddress& address)
{
    return std::holds_alternative<Ipv4Address>(address) ? AddressFamily::IPv4 : AddressFamily::IPv6;
}

std::string ToString(const Ipv4Address& address)
{
    return fmt::format("{}.{}.{}.{}", address.octets[0], address.octets[1], address.octets[2], address.octets[3]);
}

std::string ToString(const Ipv6Address& address)
{
    struct in6_addr addr;
    std::memcpy(addr.s6_addr, address.octets.data(), address.octets.size());

    char buffer[INET6_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET6, &addr, buffer, sizeof(buffer)) == nullptr) {
        return "";
    }
    return buffer;
}

std::string ToString(const IpAddress& address)
{
    return std::visit([](const auto& addr) { return ToString(addr); }, address);
}

std::ostream& operator<<(std::ostream& os, const IpAddress& address)
{
    os << ToString(address);
    return os;
}

std::optional<IpAddress> ParseIpAddress(std::string_view text)
{
    const std::string str(text);

    struct in_addr addr4;
    if (inet_pton(AF_INET, str.c_str(), &addr4) == 1) {
        Ipv4Address address;
        std::memcpy(address.octets.data(), &addr4.s_addr, address.octets.size());
        return IpAddress(address);
    }

    struct in6_addr addr6;
    if (inet_pton(AF_INET6, str.c_str(), &addr6) == 1) {
        Ipv6Address address;
        std::memcpy(address.octets.data(), addr6.s6_addr, address.octets.size());
        return IpAddress(address);
    }

    return std::nullopt;
}

std::string ToString(EntryType entry)
{
    switch (entry) {
        case EntryType::UNKNOWN: return "unknown";
        case EntryType::QUESTION: return "question";
        case EntryType::ANSWER: return "answer";
        case EntryType::AUTHORITY: return "authority";
        case EntryType::ADDITIONAL: return "additional";
    }
    return "";
}

std::ostream& operator<<(std::ostream& os, const RecordHeader& header)
{
    os << fmt::format("{} : {} {}", header.from_address, ToString(header.entry_type), header.name);
    return os;
}

std::ostream& operator<<(std::ostream& os, const DomainNamePointerRecord& record)
{
    os << fmt::format("{} PTR {} rclass {:#x} ttl {} length {}", fmt::streamed(record.header), record.target, record.header.rclass, record.header.ttl, record.header.record_length);
    return os;
}

std::ostream& operator<<(std::ostream& os, const ServiceRecord& record)
{
    os << fmt::format("{} SRV {} priority {} weight {} port {}", fmt::streamed(record.header), record.target, record.priority, record.weight, record.port);
    return os;
}

std::ostream& operator<<(std::ostream& os, const ARecord& record)
{
    os << fmt::format("{} A {}", fmt::streamed(record.header), ToString(record.address));
    return os;
}

std::ostream& operator<<(std::ostream& os, const AAAARecord& record)
{
    os << fmt::format("{} AAAA {}", fmt::streamed(record.header), ToString(record.address));
    return os;
}

std::ostream& operator<<(std::ostream& os, const TXTRecord& record)
{
    os << fmt::format("{} TXT {}", fmt::streamed(record.header), record.txt);
    return os;
}

std::ostream& operator<<(std::ostream& os, const AnyRecord& record)
{
    os << fmt::format("{} type {} rclass {:#x} ttl {} length {}", fmt::streamed(record.header), record.header.record_type, record.header.rclass, record.header.ttl, record.header.record_length);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Record& record)
{
    std::visit([&os](const auto& rec){
        os << rec;
    }, record);
    return os;
}

Response::Response(std::string from_address, std::vector<Record> records)
: m_fromAddress(std::move(from_address))
, m_records(std::move(records))
{}

void Response::AddRecord(Record record)
{
    m_records.push_back(std::move(record));
}

}
