#ifndef STORE_HPP
#define STORE_HPP

#include <ArduinoJson.h>
#include <string>

/*
 * Persisted JSON document made of named values.
 *
 * An absent document behaves as if every key was absent.
 * Writes always replace the whole value of a key.
 */
class Store {
public:
    virtual ~Store() = default;

    /**
     * @brief Read the whole document
     *
     * @return false if the document is absent or unreadable
     */
    virtual bool load(JsonDocument &document) = 0;

    /**
     * @brief Replace the whole document
     *
     * @return false if the document could not be written
     */
    virtual bool save(const JsonDocument &document) = 0;

    /**
     * @brief Read the value stored under key
     *
     * @return false if the document or the key is absent
     */
    virtual bool get(const std::string &key, JsonDocument &value);

    /**
     * @brief Replace the value stored under key
     *
     * Other keys of the document are left untouched.
     *
     * @return false if the document could not be written
     */
    virtual bool set(const std::string &key, JsonVariantConst value);
};

#endif
