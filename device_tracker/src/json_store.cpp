#include "json_store.hpp"
#include "logger.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

JsonFileStore::JsonFileStore(const std::string &path):
m_path(path)
{

}

bool JsonFileStore::exists() const
{
    return access(m_path.c_str(), F_OK) == 0;
}

bool JsonFileStore::load(JsonDocument &document)
{
    std::ifstream file(m_path);
    if (!file) {
        Logger::debug("No data file " + m_path);
        return false;
    }

    DeserializationError err = deserializeJson(document, file);
    if (err) {
        std::stringstream ss;
        ss << "Could not parse " << m_path << ": " << err.c_str();
        Logger::err(ss.str());
        document.clear();
        return false;
    }

    if (!document.is<JsonObject>()) {
        Logger::err("Root of " + m_path + " is not a JSON object");
        document.clear();
        return false;
    }

    return true;
}

bool JsonFileStore::save(const JsonDocument &document)
{
    /* Write a temporary file and rename it so a crash never leaves half a document */
    std::string tmp_path = m_path + ".tmp";
    {
        std::ofstream file(tmp_path, std::fstream::out | std::fstream::trunc);
        if (!file) {
            Logger::err("Could not write " + tmp_path);
            return false;
        }

        serializeJson(document, file);
        file.flush();
        if (!file) {
            Logger::err("Could not write " + tmp_path);
            unlink(tmp_path.c_str());
            return false;
        }
    }

    if (rename(tmp_path.c_str(), m_path.c_str()) < 0) {
        Logger::err("Could not replace " + m_path);
        unlink(tmp_path.c_str());
        return false;
    }

    Logger::debug("Saved " + m_path);
    return true;
}

bool JsonFileStore::set(const std::string &key, JsonVariantConst value)
{
    JsonDocument document;
    if (!load(document)) {
        if (exists()) {
            Logger::err("Refusing to overwrite unreadable file " + m_path);
            return false;
        }
        document.to<JsonObject>();
    }

    document[key].set(value);
    return save(document);
}

std::string backup_path(const std::string &path, time_t now)
{
    char buffer[32];
    struct tm t;
    localtime_r(&now, &t);
    strftime(buffer, sizeof(buffer), "%Y%m%d%H%M%S", &t);

    std::stringstream ss;
    ss << path << '.' << buffer << ".bak";
    return ss.str();
}
