#pragma once

#include <stdexcept>
#include <string>

namespace mdns_scan
{

// A discovery session could not be opened for a query. No scan runs.
struct SessionOpenError : std::runtime_error
{
    std::string query;

    SessionOpenError(const std::string& msg, const std::string& query_ = "")
    : std::runtime_error(msg), query(query_) {}
};

// A single response could not be decoded. The session stays usable.
struct ResponseError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

}
