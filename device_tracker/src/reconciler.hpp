#ifndef RECONCILER_HPP
#define RECONCILER_HPP

#include "config.hpp"
#include "device.hpp"
#include "favourites.hpp"
#include "matcher.hpp"
#include "prober.hpp"
#include <string>
#include <time.h>
#include <vector>

#define CONFLICT_SUFFIX     "_CONFLICT_OLDIP_NEWMAC"

/* What happened to one favourite during a pass */
struct ReconcileEvent {
    std::string name;
    MatchState state;
    bool recovered;                     /* found by the retry probe */
    std::string address;
    std::string hw_address;
    time_t last_seen;
    std::string observed_address;
    std::string observed_hw_address;
};

struct ReconcileReport {
    time_t timestamp;
    std::vector<FavouriteRecord> online;
    std::vector<FavouriteRecord> updated;
    std::vector<ReconcileEvent> events;
    bool saved;                         /* updated list was persisted */
};

class Reconciler {
public:
    Reconciler(Prober &prober, FavouriteManager &favourites, const Config &config);

    /**
     * @brief Reconcile favourites against a snapshot
     *
     * Favourites that are not seen are probed once more. The updated
     * list replaces the stored one in a single write at the end.
     *
     * @param favourites
     * @param snapshot devices found by a range scan
     * @param now timestamp written for every favourite seen online
     * @return online favourites, updated list and one event per favourite
     */
    ReconcileReport reconcile(const std::vector<FavouriteRecord> &favourites,
                              const Snapshot &snapshot,
                              time_t now);

    /* Scan the configured range */
    Snapshot scan();

    /* Load favourites, scan and reconcile */
    ReconcileReport runPass(time_t now);

private:
    Prober &m_prober;
    FavouriteManager &m_favourites;
    const Config &m_config;
};

#endif
