#pragma once

#include <string>
#include <vector>

#include "mdns_scan/binding_set.hpp"

namespace mdns_scan
{

inline constexpr const char* kNotFound = "Not found";

struct HostRow {
    std::string host;
    std::string ipv4;
    std::string ipv6;
};
bool operator==(const HostRow& lhs, const HostRow& rhs);
std::ostream& operator<<(std::ostream& os, const HostRow& row);

// One row per distinct host name, missing addresses shown as kNotFound
std::vector<HostRow> BuildHostRows(const BindingSet& set);

}
