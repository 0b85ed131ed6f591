#include "mdns_scan/record_store.hpp"

namespace mdns_scan
{

void RecordStore::Apply(const std::vector<AddressBinding>& batch)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_bindings.Apply(batch);
}

BindingSet RecordStore::Snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bindings;
}

void RecordStore::Clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_bindings.Clear();
}

std::size_t RecordStore::Size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bindings.Size();
}

}
