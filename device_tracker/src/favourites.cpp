#include "favourites.hpp"
#include "address_range.hpp"
#include "logger.hpp"
#include "matcher.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

bool favourite_from_json(JsonVariantConst v, FavouriteRecord &f)
{
    JsonArrayConst entry = v.as<JsonArrayConst>();
    if (entry.isNull() || entry.size() < 2 || entry.size() > 3)
        return false;

    JsonArrayConst pair = entry[1].as<JsonArrayConst>();
    if (!entry[0].is<const char*>()
    ||  pair.isNull() || pair.size() != 2
    ||  !pair[0].is<const char*>()
    ||  !pair[1].is<const char*>())
        return false;

    f.name = entry[0].as<std::string>();
    f.address = pair[0].as<std::string>();
    f.hw_address = pair[1].as<std::string>();
    f.last_seen = 0;

    /* Older files store fractional timestamps */
    if (entry.size() == 3) {
        if (!entry[2].is<double>())
            return false;
        double t = entry[2].as<double>();
        if (!std::isfinite(t)
        ||  t < static_cast<double>(std::numeric_limits<time_t>::min())
        ||  t >= static_cast<double>(std::numeric_limits<time_t>::max()))
            return false;
        f.last_seen = static_cast<time_t>(t);
    }

    return true;
}

void favourite_to_json(const FavouriteRecord &f, JsonArray out)
{
    out.add(f.name);
    JsonArray pair = out.add<JsonArray>();
    pair.add(f.address);
    pair.add(f.hw_address);
    out.add(static_cast<int64_t>(f.last_seen));
}

FavouriteManager::FavouriteManager(Store &store, Prober &prober, const Config &config):
m_store(store),
m_prober(prober),
m_config(config)
{

}

std::vector<FavouriteRecord> FavouriteManager::loadFavourites()
{
    std::vector<FavouriteRecord> favourites;

    JsonDocument value;
    if (!m_store.get(m_config.favourites_key, value)) {
        Logger::debug("No favourites found with key " + m_config.favourites_key);
        return favourites;
    }

    if (!value.is<JsonArray>()) {
        Logger::warn("Favourites key " + m_config.favourites_key + " does not hold a list");
        return favourites;
    }

    unsigned int index = 0;
    for (JsonVariantConst v : value.as<JsonArrayConst>()) {
        FavouriteRecord f;
        if (favourite_from_json(v, f)) {
            favourites.push_back(f);
        } else {
            std::stringstream ss;
            ss << "Ignoring malformed favourite #" << index
               << ", it will be dropped from " << m_config.favourites_key << " on the next save";
            Logger::warn(ss.str());
        }
        ++index;
    }

    std::stringstream ss;
    ss << "Loaded " << favourites.size() << " favourites";
    Logger::debug(ss.str());
    for (auto &f : favourites)
        Logger::debug(f.name + " (last: " + format_timestamp(f.last_seen) + ") is at (IP: "
                      + f.address + ", MAC: " + f.hw_address + ')');

    return favourites;
}

bool FavouriteManager::storeFavourites(const std::vector<FavouriteRecord> &favourites)
{
    JsonDocument document;
    JsonArray list = document.to<JsonArray>();
    for (auto &f : favourites)
        favourite_to_json(f, list.add<JsonArray>());

    if (!m_store.set(m_config.favourites_key, document.as<JsonVariantConst>())) {
        Logger::err("Could not save favourites");
        return false;
    }

    return true;
}

bool FavouriteManager::resolveHwAddress(const std::string &address,
                                        const Snapshot *snapshot,
                                        std::string &hw_address)
{
    if (snapshot) {
        const Device *d = find_by_address(address, *snapshot);
        if (!d)
            return false;
        hw_address = d->hw_address;
        return true;
    }

    Logger::debug("MAC address not given, sending ARP request to " + address);
    Snapshot devices = m_prober.probe(address, m_config.retry_timeout_ms);
    const Device *d = find_by_address(address, devices);
    if (!d)
        return false;

    hw_address = d->hw_address;
    return true;
}

ResultCode FavouriteManager::saveFavourite(const std::string &name,
                                           const std::string &address,
                                           const std::string &hw_address,
                                           time_t last_seen,
                                           const Snapshot *snapshot)
{
    uint32_t ip;
    if (name.empty() || !parse_ipv4(address, ip)) {
        Logger::err("Invalid favourite \"" + name + "\" with IP " + address);
        return RESULT_UNRESOLVABLE;
    }

    std::string mac;
    if (hw_address.empty()) {
        if (!resolveHwAddress(address, snapshot, mac)) {
            Logger::err("MAC address not found for IP " + address);
            return RESULT_UNRESOLVABLE;
        }
    } else if (!normalize_mac(hw_address, mac)) {
        Logger::err("Invalid MAC address " + hw_address);
        return RESULT_UNRESOLVABLE;
    }

    if (last_seen == 0)
        last_seen = time(nullptr);

    std::vector<FavouriteRecord> favourites = loadFavourites();
    size_t old_size = favourites.size();
    favourites.erase(std::remove_if(favourites.begin(), favourites.end(),
        [&name] (const FavouriteRecord &f){ return f.name == name; }), favourites.end());
    if (favourites.size() != old_size) {
        std::stringstream ss;
        ss << "Found " << old_size - favourites.size() << " old entries with name " << name << ", overwriting them";
        Logger::info(ss.str());
    }

    FavouriteRecord f;
    f.name = name;
    f.address = address;
    f.hw_address = mac;
    f.last_seen = last_seen;
    favourites.push_back(f);

    Logger::info("Saving favourite " + name + " (last: " + format_timestamp(last_seen)
                 + ") with IP " + address + " and MAC " + mac);

    if (!storeFavourites(favourites))
        return RESULT_IO_ERROR;

    return RESULT_OK;
}

bool FavouriteManager::deleteFavourite(const std::string &name)
{
    std::vector<FavouriteRecord> favourites = loadFavourites();
    if (favourites.empty()) {
        Logger::info("No favourites found at all, none to delete");
        return false;
    }

    size_t old_size = favourites.size();
    favourites.erase(std::remove_if(favourites.begin(), favourites.end(),
        [&name] (const FavouriteRecord &f){ return f.name == name; }), favourites.end());

    size_t count = old_size - favourites.size();
    if (count == 0) {
        Logger::info("No favourite with name " + name);
        return false;
    }

    std::stringstream ss;
    ss << "Deleting all favourites with name " << name << " (# found: " << count << ')';
    Logger::info(ss.str());

    return storeFavourites(favourites);
}

ResultCode FavouriteManager::backup(Store &destination)
{
    JsonDocument document;
    if (!m_store.load(document)) {
        Logger::warn("No data found, nothing to backup");
        return RESULT_NOT_FOUND;
    }

    if (!destination.save(document)) {
        Logger::err("Could not write backup");
        return RESULT_IO_ERROR;
    }

    return RESULT_OK;
}
