#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mdns_scan/types.hpp"

namespace mdns_scan
{

// A host name bound to one address. The family is fixed by the address.
class AddressBinding
{
public:
    AddressBinding(IpAddress address, std::string host_name);

    AddressFamily Family() const { return m_family; }
    const IpAddress& Address() const { return m_address; }
    const std::string& HostName() const { return m_hostName; }

    // Same family and host name, the address may differ
    bool SameSlot(const AddressBinding& other) const;

private:
    AddressFamily m_family;
    IpAddress m_address;
    std::string m_hostName;
};
bool operator==(const AddressBinding& lhs, const AddressBinding& rhs);
bool operator!=(const AddressBinding& lhs, const AddressBinding& rhs);
// Family, then address, then host name
bool operator<(const AddressBinding& lhs, const AddressBinding& rhs);
std::ostream& operator<<(std::ostream& os, const AddressBinding& binding);

struct HostAddresses {
    std::optional<Ipv4Address> ipv4;
    std::optional<Ipv6Address> ipv6;
};

// Sorted bindings, at most one per (family, host name)
class BindingSet
{
public:
    using const_iterator = std::vector<AddressBinding>::const_iterator;

    // Each binding replaces the one in its slot, the set is sorted afterwards
    void Apply(const std::vector<AddressBinding>& batch);
    void Clear();

    HostAddresses Lookup(const std::string& host_name) const;
    // Unique host names in iteration order
    std::vector<std::string> DistinctHostNames() const;

    std::size_t Size() const { return m_entries.size(); }
    [[nodiscard]] bool Empty() const { return m_entries.empty(); }
    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

private:
    std::vector<AddressBinding> m_entries;
};
bool operator==(const BindingSet& lhs, const BindingSet& rhs);
std::ostream& operator<<(std::ostream& os, const BindingSet& set);

}
