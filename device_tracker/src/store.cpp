#include "store.hpp"

bool Store::get(const std::string &key, JsonDocument &value)
{
    JsonDocument document;
    if (!load(document))
        return false;

    const JsonDocument &loaded = document;
    JsonVariantConst v = loaded[key];
    if (v.isNull())
        return false;

    value.set(v);
    return true;
}

bool Store::set(const std::string &key, JsonVariantConst value)
{
    JsonDocument document;
    if (!load(document) || !document.is<JsonObject>())
        document.to<JsonObject>();

    document[key].set(value);
    return save(document);
}
