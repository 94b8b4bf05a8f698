#include "reconciler.hpp"
#include "logger.hpp"
#include <algorithm>
#include <sstream>

namespace {

FavouriteRecord make_record(const std::string &name,
                            const std::string &address,
                            const std::string &hw_address,
                            time_t last_seen)
{
    FavouriteRecord f;
    f.name = name;
    f.address = address;
    f.hw_address = hw_address;
    f.last_seen = last_seen;
    return f;
}

}

Reconciler::Reconciler(Prober &prober, FavouriteManager &favourites, const Config &config):
m_prober(prober),
m_favourites(favourites),
m_config(config)
{

}

Snapshot Reconciler::scan()
{
    return m_prober.probeRange(m_config.scan_range, m_config.scan_timeout_ms);
}

ReconcileReport Reconciler::reconcile(const std::vector<FavouriteRecord> &favourites,
                                      const Snapshot &snapshot,
                                      time_t now)
{
    ReconcileReport report;
    report.timestamp = now;
    report.saved = false;

    std::vector<FavouriteRecord> splits;
    for (auto &f : favourites) {
        MatchResult match = classify(f.address, f.hw_address, snapshot);

        ReconcileEvent event;
        event.name = f.name;
        event.recovered = false;
        event.address = f.address;
        event.hw_address = f.hw_address;
        event.last_seen = f.last_seen;
        event.observed_address = match.observed_address;
        event.observed_hw_address = match.observed_hw_address;

        /* The range scan may miss hosts slow to answer */
        if (match.state == MATCH_NONE) {
            if (!m_prober.probe(f.address, m_config.retry_timeout_ms).empty()) {
                match.state = MATCH_EXACT;
                event.recovered = true;
            }
        }

        event.state = match.state;

        switch (match.state) {
        case MATCH_NONE:
        case MATCH_MAC_MOVED:
            /* Not proof the device is still around, keep the old binding */
            report.updated.push_back(f);
            break;
        case MATCH_IP_MOVED:
            report.online.push_back(make_record(f.name, match.observed_address, f.hw_address, f.last_seen));
            report.updated.push_back(make_record(f.name, match.observed_address, f.hw_address, now));
            break;
        case MATCH_CONFLICT:
            /* Trust MAC over IP */
            report.online.push_back(make_record(f.name, match.observed_address, f.hw_address, f.last_seen));
            report.updated.push_back(make_record(f.name, match.observed_address, f.hw_address, now));
            splits.push_back(make_record(f.name + CONFLICT_SUFFIX, f.address, match.observed_hw_address, now));
            break;
        case MATCH_EXACT:
            report.online.push_back(f);
            report.updated.push_back(make_record(f.name, f.address, f.hw_address, now));
            break;
        }

        report.events.push_back(event);
    }

    /* A split from this pass replaces any record left by an older one */
    for (auto &split : splits) {
        const std::string &name = split.name;
        report.updated.erase(std::remove_if(report.updated.begin(), report.updated.end(),
            [&name] (const FavouriteRecord &f){ return f.name == name; }), report.updated.end());
        report.updated.push_back(split);
    }

    report.saved = m_favourites.storeFavourites(report.updated);

    std::stringstream ss;
    ss << report.online.size() << '/' << favourites.size() << " favourites online";
    Logger::debug(ss.str());

    return report;
}

ReconcileReport Reconciler::runPass(time_t now)
{
    std::vector<FavouriteRecord> favourites = m_favourites.loadFavourites();
    Snapshot snapshot = scan();
    return reconcile(favourites, snapshot, now);
}
