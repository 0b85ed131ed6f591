#pragma once

#include <mutex>
#include <vector>

#include "mdns_scan/binding_set.hpp"

namespace mdns_scan
{

// Thread safe BindingSet shared between the scan thread and the display.
// A snapshot never shows a partially applied batch.
class RecordStore
{
public:
    void Apply(const std::vector<AddressBinding>& batch);
    BindingSet Snapshot() const;
    void Clear();

    std::size_t Size() const;

private:
    mutable std::mutex m_mutex;
    BindingSet m_bindings;
};

}
