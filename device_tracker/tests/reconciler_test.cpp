#include <gtest/gtest.h>
#include "config.hpp"
#include "fakes.hpp"
#include "favourites.hpp"
#include "reconciler.hpp"

class ReconcilerTest : public ::testing::Test {
protected:
    ReconcilerTest():
    config(),
    prober(),
    store(),
    favourites(store, prober, config),
    reconciler(prober, favourites, config)
    {
    }

    Config config;
    FakeProber prober;
    MemoryStore store;
    FavouriteManager favourites;
    Reconciler reconciler;
};

TEST_F(ReconcilerTest, IpMoved)
{
    std::vector<FavouriteRecord> favs = {
        make_favourite("printer", "192.168.178.50", "aa:bb:cc:dd:ee:01", 1000),
    };
    Snapshot s = { make_device("192.168.178.99", "aa:bb:cc:dd:ee:01") };

    ReconcileReport r = reconciler.reconcile(favs, s, 5000);

    ASSERT_EQ(1u, r.online.size());
    EXPECT_EQ(make_favourite("printer", "192.168.178.99", "aa:bb:cc:dd:ee:01", 1000), r.online[0]);
    ASSERT_EQ(1u, r.updated.size());
    EXPECT_EQ(make_favourite("printer", "192.168.178.99", "aa:bb:cc:dd:ee:01", 5000), r.updated[0]);
    ASSERT_EQ(1u, r.events.size());
    EXPECT_EQ(MATCH_IP_MOVED, r.events[0].state);
    EXPECT_TRUE(prober.probes().empty());
}

TEST_F(ReconcilerTest, ConflictSplitsRecord)
{
    std::vector<FavouriteRecord> favs = {
        make_favourite("phone", "192.168.178.20", "11:22:33:44:55:66", 500),
    };
    Snapshot s = {
        make_device("192.168.178.20", "ff:ee:dd:cc:bb:aa"),
        make_device("192.168.178.77", "11:22:33:44:55:66"),
    };

    ReconcileReport r = reconciler.reconcile(favs, s, 9000);

    ASSERT_EQ(1u, r.online.size());
    EXPECT_EQ(make_favourite("phone", "192.168.178.77", "11:22:33:44:55:66", 500), r.online[0]);

    ASSERT_EQ(2u, r.updated.size());
    EXPECT_EQ(make_favourite("phone", "192.168.178.77", "11:22:33:44:55:66", 9000), r.updated[0]);
    EXPECT_EQ(make_favourite("phone_CONFLICT_OLDIP_NEWMAC", "192.168.178.20", "ff:ee:dd:cc:bb:aa", 9000),
              r.updated[1]);

    unsigned int named = 0;
    unsigned int derived = 0;
    for (auto &f : r.updated) {
        if (f.name == "phone")
            named++;
        if (f.name == "phone_CONFLICT_OLDIP_NEWMAC")
            derived++;
    }
    EXPECT_EQ(1u, named);
    EXPECT_EQ(1u, derived);
}

TEST_F(ReconcilerTest, RepeatedConflictReplacesOlderSplit)
{
    std::vector<FavouriteRecord> favs = {
        make_favourite("phone", "192.168.178.77", "11:22:33:44:55:66", 500),
        make_favourite("phone_CONFLICT_OLDIP_NEWMAC", "192.168.178.20", "ff:ee:dd:cc:bb:aa", 500),
    };
    Snapshot s = {
        make_device("192.168.178.77", "de:ad:be:ef:00:01"),
        make_device("192.168.178.88", "11:22:33:44:55:66"),
    };

    ReconcileReport r = reconciler.reconcile(favs, s, 9000);

    ASSERT_EQ(2u, r.events.size());
    EXPECT_EQ(MATCH_CONFLICT, r.events[0].state);
    EXPECT_EQ(MATCH_NONE, r.events[1].state);

    ASSERT_EQ(2u, r.updated.size());
    EXPECT_EQ(make_favourite("phone", "192.168.178.88", "11:22:33:44:55:66", 9000), r.updated[0]);
    EXPECT_EQ(make_favourite("phone_CONFLICT_OLDIP_NEWMAC", "192.168.178.77", "de:ad:be:ef:00:01", 9000),
              r.updated[1]);

    /* A third pass must not grow the list either */
    ReconcileReport again = reconciler.reconcile(r.updated, {
        make_device("192.168.178.88", "00:00:00:00:00:09"),
        make_device("192.168.178.99", "11:22:33:44:55:66"),
    }, 9500);

    unsigned int derived = 0;
    for (auto &f : again.updated) {
        if (f.name == "phone_CONFLICT_OLDIP_NEWMAC")
            derived++;
    }
    EXPECT_EQ(1u, derived);
    EXPECT_EQ(2u, again.updated.size());
}

TEST_F(ReconcilerTest, ExactRefreshesTimestamp)
{
    FavouriteRecord f = make_favourite("tv", "192.168.178.10", "00:11:22:33:44:55", 100);
    Snapshot s = { make_device("192.168.178.10", "00:11:22:33:44:55") };

    ReconcileReport r = reconciler.reconcile({f}, s, 200);

    ASSERT_EQ(1u, r.online.size());
    EXPECT_EQ(f, r.online[0]);
    ASSERT_EQ(1u, r.updated.size());
    EXPECT_EQ(make_favourite("tv", "192.168.178.10", "00:11:22:33:44:55", 200), r.updated[0]);
    EXPECT_FALSE(r.events[0].recovered);
}

TEST_F(ReconcilerTest, MacMovedKeepsRecord)
{
    FavouriteRecord f = make_favourite("nas", "192.168.178.40", "00:00:00:00:00:01", 123);
    Snapshot s = { make_device("192.168.178.40", "00:00:00:00:00:02") };

    ReconcileReport r = reconciler.reconcile({f}, s, 999);

    EXPECT_TRUE(r.online.empty());
    ASSERT_EQ(1u, r.updated.size());
    EXPECT_EQ(f, r.updated[0]);
    EXPECT_EQ(MATCH_MAC_MOVED, r.events[0].state);
    EXPECT_EQ("00:00:00:00:00:02", r.events[0].observed_hw_address);
    EXPECT_TRUE(prober.probes().empty());
}

TEST_F(ReconcilerTest, NoneWithoutAnswerKeepsRecord)
{
    FavouriteRecord f = make_favourite("laptop", "192.168.178.60", "00:00:00:00:00:60", 321);

    ReconcileReport r = reconciler.reconcile({f}, Snapshot(), 999);

    EXPECT_TRUE(r.online.empty());
    ASSERT_EQ(1u, r.updated.size());
    EXPECT_EQ(f, r.updated[0]);
    ASSERT_EQ(1u, prober.probes().size());
    EXPECT_EQ("192.168.178.60", prober.probes()[0]);
    EXPECT_EQ(MATCH_NONE, r.events[0].state);
}

TEST_F(ReconcilerTest, NoneRecoveredBySecondProbe)
{
    FavouriteRecord f = make_favourite("laptop", "192.168.178.60", "00:00:00:00:00:60", 321);
    prober.answer("192.168.178.60", "00:00:00:00:00:60");

    ReconcileReport r = reconciler.reconcile({f}, Snapshot(), 999);

    ASSERT_EQ(1u, r.online.size());
    EXPECT_EQ(f, r.online[0]);
    ASSERT_EQ(1u, r.updated.size());
    EXPECT_EQ(make_favourite("laptop", "192.168.178.60", "00:00:00:00:00:60", 999), r.updated[0]);
    EXPECT_EQ(MATCH_EXACT, r.events[0].state);
    EXPECT_TRUE(r.events[0].recovered);
}

TEST_F(ReconcilerTest, UpdatedListWrittenOnce)
{
    std::vector<FavouriteRecord> favs = {
        make_favourite("a", "192.168.178.2", "00:00:00:00:00:02", 1),
        make_favourite("b", "192.168.178.3", "00:00:00:00:00:03", 2),
        make_favourite("c", "192.168.178.4", "00:00:00:00:00:04", 3),
    };
    Snapshot s = { make_device("192.168.178.2", "00:00:00:00:00:02") };

    ReconcileReport r = reconciler.reconcile(favs, s, 50);

    EXPECT_TRUE(r.saved);
    EXPECT_EQ(1u, store.saves());
    EXPECT_EQ(r.updated, favourites.loadFavourites());
}

TEST_F(ReconcilerTest, WriteFailureDoesNotAbortPass)
{
    store.setFailWrites(true);
    std::vector<FavouriteRecord> favs = {
        make_favourite("a", "192.168.178.2", "00:00:00:00:00:02", 1),
        make_favourite("b", "192.168.178.3", "00:00:00:00:00:03", 2),
    };
    Snapshot s = {
        make_device("192.168.178.2", "00:00:00:00:00:02"),
        make_device("192.168.178.3", "00:00:00:00:00:03"),
    };

    ReconcileReport r = reconciler.reconcile(favs, s, 50);

    EXPECT_FALSE(r.saved);
    EXPECT_EQ(2u, r.online.size());
    EXPECT_EQ(2u, r.updated.size());
}

TEST_F(ReconcilerTest, SecondPassGivesSameOnlineSet)
{
    std::vector<FavouriteRecord> favs = {
        make_favourite("printer", "192.168.178.50", "aa:bb:cc:dd:ee:01", 1000),
        make_favourite("tv", "192.168.178.10", "00:11:22:33:44:55", 100),
        make_favourite("gone", "192.168.178.11", "00:11:22:33:44:56", 100),
    };
    Snapshot s = {
        make_device("192.168.178.99", "aa:bb:cc:dd:ee:01"),
        make_device("192.168.178.10", "00:11:22:33:44:55"),
    };

    ReconcileReport first = reconciler.reconcile(favs, s, 2000);
    ReconcileReport second = reconciler.reconcile(favs, s, 2000);

    EXPECT_EQ(first.online, second.online);
    ASSERT_EQ(first.events.size(), second.events.size());
    for (size_t i = 0; i < first.events.size(); ++i)
        EXPECT_EQ(first.events[i].state, second.events[i].state);
}

TEST_F(ReconcilerTest, RunPassScansConfiguredRange)
{
    config.scan_range = "10.0.0.0/24";
    ASSERT_EQ(RESULT_OK, favourites.saveFavourite("tv", "10.0.0.5", "00:11:22:33:44:55", 10));
    prober.setRangeSnapshot({ make_device("10.0.0.6", "00:11:22:33:44:55") });

    ReconcileReport r = reconciler.runPass(20);

    ASSERT_EQ(1u, prober.ranges().size());
    EXPECT_EQ("10.0.0.0/24", prober.ranges()[0]);
    ASSERT_EQ(1u, r.online.size());
    EXPECT_EQ("10.0.0.6", r.online[0].address);

    std::vector<FavouriteRecord> stored = favourites.loadFavourites();
    ASSERT_EQ(1u, stored.size());
    EXPECT_EQ(make_favourite("tv", "10.0.0.6", "00:11:22:33:44:55", 20), stored[0]);
}

TEST_F(ReconcilerTest, EmptyFavouritesStillWritten)
{
    ReconcileReport r = reconciler.runPass(20);

    EXPECT_TRUE(r.online.empty());
    EXPECT_TRUE(r.updated.empty());
    EXPECT_TRUE(r.saved);
    EXPECT_TRUE(store.present());
}
