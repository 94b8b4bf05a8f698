#ifndef FAVOURITES_HPP
#define FAVOURITES_HPP

#include "config.hpp"
#include "device.hpp"
#include "errors.hpp"
#include "prober.hpp"
#include "store.hpp"
#include <ArduinoJson.h>
#include <string>
#include <time.h>
#include <vector>

/*
 * JSON layout of one favourite:
 *
 *   [name, [address, hw_address], last_seen]
 */
bool favourite_from_json(JsonVariantConst v, FavouriteRecord &f);
void favourite_to_json(const FavouriteRecord &f, JsonArray out);

class FavouriteManager {
public:
    FavouriteManager(Store &store, Prober &prober, const Config &config);

    /* Absent document or key gives an empty list */
    std::vector<FavouriteRecord> loadFavourites();

    /* Replace the whole list */
    bool storeFavourites(const std::vector<FavouriteRecord> &favourites);

    /**
     * @brief Save a favourite, replacing all records with the same name
     *
     * @param name
     * @param address IPv4 address
     * @param hw_address MAC address. If empty, it is looked up in
     * snapshot, or resolved with an ARP request if snapshot is null.
     * @param last_seen 0 means now
     * @param snapshot
     * @return RESULT_UNRESOLVABLE if the MAC address is unknown
     */
    ResultCode saveFavourite(const std::string &name,
                             const std::string &address,
                             const std::string &hw_address = std::string(),
                             time_t last_seen = 0,
                             const Snapshot *snapshot = nullptr);

    /**
     * @brief Remove every record called name
     *
     * @return true if at least one record was removed
     */
    bool deleteFavourite(const std::string &name);

    /**
     * @brief Copy the whole document to destination
     *
     * @return RESULT_NOT_FOUND if there is no document
     */
    ResultCode backup(Store &destination);

private:
    bool resolveHwAddress(const std::string &address,
                          const Snapshot *snapshot,
                          std::string &hw_address);

    Store &m_store;
    Prober &m_prober;
    const Config &m_config;
};

#endif
