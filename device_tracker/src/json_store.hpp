#ifndef JSON_STORE_HPP
#define JSON_STORE_HPP

#include "store.hpp"
#include <ArduinoJson.h>
#include <string>
#include <time.h>

/*
 * Store kept in a JSON file whose root is an object.
 *
 * A missing file is an empty document. A file that exists but cannot
 * be parsed is never overwritten by set().
 */
class JsonFileStore : public Store {
public:
    explicit JsonFileStore(const std::string &path);

    virtual bool load(JsonDocument &document);
    virtual bool save(const JsonDocument &document);
    virtual bool set(const std::string &key, JsonVariantConst value);

    bool exists() const;

private:
    std::string m_path;
};

/* <path>.<YYYYmmddHHMMSS>.bak */
std::string backup_path(const std::string &path, time_t now);

#endif
