#include "mdns_scan/discovery.hpp"
#include "mdns_scan/errors.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace mdns_scan;

TEST(NormalizeQueryTest, AddsRootDot)
{
    EXPECT_EQ(NormalizeQuery("_http._tcp.local"), "_http._tcp.local.");
    EXPECT_EQ(NormalizeQuery("_http._tcp.local."), "_http._tcp.local.");
}

TEST(NormalizeQueryTest, RejectsMalformedQueries)
{
    EXPECT_THROW(NormalizeQuery(""), SessionOpenError);
    EXPECT_THROW(NormalizeQuery("."), SessionOpenError);
    EXPECT_THROW(NormalizeQuery("_http.._tcp.local"), SessionOpenError);
    EXPECT_THROW(NormalizeQuery("_http._tcp local"), SessionOpenError);
    EXPECT_THROW(NormalizeQuery(std::string(64, 'a') + ".local"), SessionOpenError);
    EXPECT_THROW(NormalizeQuery(std::string(300, 'a')), SessionOpenError);
}

TEST(NormalizeQueryTest, ErrorCarriesQuery)
{
    try {
        NormalizeQuery("bad..query");
        FAIL() << "expected SessionOpenError";
    } catch (const SessionOpenError& e) {
        EXPECT_EQ(e.query, "bad..query");
    }
}
