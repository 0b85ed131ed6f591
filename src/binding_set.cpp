#include "mdns_scan/binding_set.hpp"

#include <algorithm>
#include <tuple>
#include <type_traits>
#include <unordered_set>

#include <fmt/core.h>

namespace mdns_scan
{

AddressBinding::AddressBinding(IpAddress address, std::string host_name)
: m_family(FamilyOf(address))
, m_address(std::move(address))
, m_hostName(std::move(host_name))
{}

bool AddressBinding::SameSlot(const AddressBinding& other) const
{
    return m_family == other.m_family && m_hostName == other.m_hostName;
}

bool operator==(const AddressBinding& lhs, const AddressBinding& rhs)
{
    return lhs.Address() == rhs.Address()
        && lhs.HostName() == rhs.HostName();
}

bool operator!=(const AddressBinding& lhs, const AddressBinding& rhs)
{
    return !(lhs == rhs);
}

bool operator<(const AddressBinding& lhs, const AddressBinding& rhs)
{
    // variant ordering compares the alternative index first, so IPv4 sorts before IPv6
    return std::tie(lhs.Address(), lhs.HostName()) < std::tie(rhs.Address(), rhs.HostName());
}

std::ostream& operator<<(std::ostream& os, const AddressBinding& binding)
{
    os << fmt::format("{}: {}", binding.HostName(), ToString(binding.Address()));
    return os;
}

void BindingSet::Apply(const std::vector<AddressBinding>& batch)
{
    for (const auto& binding : batch) {
        m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(),
                                       [&binding](const AddressBinding& existing) {
                                           return existing.SameSlot(binding);
                                       }),
                        m_entries.end());
        m_entries.push_back(binding);
    }
    std::sort(m_entries.begin(), m_entries.end());
}

void BindingSet::Clear()
{
    m_entries.clear();
}

HostAddresses BindingSet::Lookup(const std::string& host_name) const
{
    HostAddresses found;
    for (const auto& binding : m_entries) {
        if (binding.HostName() != host_name) {
            continue;
        }
        std::visit([&found](const auto& address) {
            using T = std::decay_t<decltype(address)>;
            if constexpr (std::is_same_v<T, Ipv4Address>) {
                found.ipv4 = address;
            } else {
                found.ipv6 = address;
            }
        }, binding.Address());
    }
    return found;
}

std::vector<std::string> BindingSet::DistinctHostNames() const
{
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& binding : m_entries) {
        if (seen.insert(binding.HostName()).second) {
            names.push_back(binding.HostName());
        }
    }
    return names;
}

bool operator==(const BindingSet& lhs, const BindingSet& rhs)
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

std::ostream& operator<<(std::ostream& os, const BindingSet& set)
{
    for (const auto& binding : set) {
        os << binding << "\n";
    }
    return os;
}

}
