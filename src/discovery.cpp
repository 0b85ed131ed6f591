#include "mdns_scan/discovery.hpp"
#include "mdns_scan/errors.hpp"

#include <cctype>

#include <fmt/core.h>

namespace mdns_scan
{

namespace
{
constexpr std::size_t kMaxNameLength = 255;
constexpr std::size_t kMaxLabelLength = 63;
}

std::string NormalizeQuery(const std::string& query)
{
    if (query.empty()) {
        throw SessionOpenError("Empty query.", query);
    }

    std::string normalized = query;
    if (normalized.back() != '.') {
        normalized += '.';
    }
    if (normalized.size() > kMaxNameLength) {
        throw SessionOpenError(fmt::format("Query is longer than {} characters.", kMaxNameLength), query);
    }

    std::size_t labelLength = 0;
    for (const char c : normalized) {
        if (std::iscntrl(static_cast<unsigned char>(c)) || std::isspace(static_cast<unsigned char>(c))) {
            throw SessionOpenError("Query contains whitespace or control characters.", query);
        }
        if (c != '.') {
            ++labelLength;
            continue;
        }
        if (labelLength == 0) {
            throw SessionOpenError("Query contains an empty label.", query);
        }
        if (labelLength > kMaxLabelLength) {
            throw SessionOpenError(fmt::format("Query label is longer than {} characters.", kMaxLabelLength), query);
        }
        labelLength = 0;
    }

    return normalized;
}

}
