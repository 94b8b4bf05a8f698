#include <gtest/gtest.h>
#include "fakes.hpp"
#include "matcher.hpp"

namespace {

const char *IP = "192.168.178.20";
const char *MAC = "11:22:33:44:55:66";

}

TEST(Matcher, EmptySnapshotIsNone)
{
    MatchResult r = classify(IP, MAC, Snapshot());
    EXPECT_EQ(MATCH_NONE, r.state);
    EXPECT_TRUE(r.observed_address.empty());
    EXPECT_TRUE(r.observed_hw_address.empty());
}

TEST(Matcher, UnrelatedDevicesAreNone)
{
    Snapshot s = {
        make_device("192.168.178.1", "aa:aa:aa:aa:aa:aa"),
        make_device("192.168.178.2", "bb:bb:bb:bb:bb:bb"),
    };
    EXPECT_EQ(MATCH_NONE, classify(IP, MAC, s).state);
}

TEST(Matcher, Exact)
{
    Snapshot s = {
        make_device("192.168.178.1", "aa:aa:aa:aa:aa:aa"),
        make_device(IP, MAC),
    };
    EXPECT_EQ(MATCH_EXACT, classify(IP, MAC, s).state);
}

TEST(Matcher, AddressHeldByAnotherMac)
{
    Snapshot s = { make_device(IP, "ff:ee:dd:cc:bb:aa") };
    MatchResult r = classify(IP, MAC, s);
    EXPECT_EQ(MATCH_MAC_MOVED, r.state);
    EXPECT_EQ("ff:ee:dd:cc:bb:aa", r.observed_hw_address);
}

TEST(Matcher, MacAtAnotherAddress)
{
    Snapshot s = { make_device("192.168.178.99", "aa:bb:cc:dd:ee:01") };
    MatchResult r = classify("192.168.178.50", "aa:bb:cc:dd:ee:01", s);
    EXPECT_EQ(MATCH_IP_MOVED, r.state);
    EXPECT_EQ("192.168.178.99", r.observed_address);
}

TEST(Matcher, Conflict)
{
    Snapshot s = {
        make_device(IP, "ff:ee:dd:cc:bb:aa"),
        make_device("192.168.178.77", MAC),
    };
    MatchResult r = classify(IP, MAC, s);
    EXPECT_EQ(MATCH_CONFLICT, r.state);
    EXPECT_EQ("192.168.178.77", r.observed_address);
    EXPECT_EQ("ff:ee:dd:cc:bb:aa", r.observed_hw_address);
}

TEST(Matcher, ExactFoundAfterPartialMatches)
{
    Snapshot s = {
        make_device(IP, "ff:ee:dd:cc:bb:aa"),
        make_device("192.168.178.77", MAC),
        make_device(IP, MAC),
    };
    EXPECT_EQ(MATCH_EXACT, classify(IP, MAC, s).state);
}

TEST(Matcher, FirstDuplicateWins)
{
    Snapshot s = {
        make_device("192.168.178.30", MAC),
        make_device("192.168.178.31", MAC),
    };
    MatchResult r = classify(IP, MAC, s);
    EXPECT_EQ(MATCH_IP_MOVED, r.state);
    EXPECT_EQ("192.168.178.30", r.observed_address);

    s = {
        make_device(IP, "01:01:01:01:01:01"),
        make_device(IP, "02:02:02:02:02:02"),
    };
    r = classify(IP, MAC, s);
    EXPECT_EQ(MATCH_MAC_MOVED, r.state);
    EXPECT_EQ("01:01:01:01:01:01", r.observed_hw_address);
}

TEST(Matcher, FindHelpers)
{
    Snapshot s = {
        make_device("192.168.178.1", "aa:aa:aa:aa:aa:aa"),
        make_device("192.168.178.2", "bb:bb:bb:bb:bb:bb"),
    };

    const Device *d = find_by_address("192.168.178.2", s);
    ASSERT_NE(nullptr, d);
    EXPECT_EQ("bb:bb:bb:bb:bb:bb", d->hw_address);

    d = find_by_hw_address("aa:aa:aa:aa:aa:aa", s);
    ASSERT_NE(nullptr, d);
    EXPECT_EQ("192.168.178.1", d->address);

    EXPECT_EQ(nullptr, find_by_address("192.168.178.3", s));
    EXPECT_EQ(nullptr, find_by_hw_address("cc:cc:cc:cc:cc:cc", s));
}
