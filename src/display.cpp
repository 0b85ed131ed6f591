#include "mdns_scan/display.hpp"

#include <fmt/core.h>

namespace mdns_scan
{

bool operator==(const HostRow& lhs, const HostRow& rhs)
{
    return lhs.host == rhs.host
        && lhs.ipv4 == rhs.ipv4
        && lhs.ipv6 == rhs.ipv6;
}

std::ostream& operator<<(std::ostream& os, const HostRow& row)
{
    os << fmt::format("{} | {} | {}", row.host, row.ipv4, row.ipv6);
    return os;
}

std::vector<HostRow> BuildHostRows(const BindingSet& set)
{
    std::vector<HostRow> rows;
    for (const auto& host : set.DistinctHostNames()) {
        const auto addresses = set.Lookup(host);
        HostRow row;
        row.host = host;
        row.ipv4 = addresses.ipv4 ? ToString(*addresses.ipv4) : kNotFound;
        row.ipv6 = addresses.ipv6 ? ToString(*addresses.ipv6) : kNotFound;
        rows.push_back(std::move(row));
    }
    return rows;
}

}
