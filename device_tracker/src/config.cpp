#include "config.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#define DEFAULT_SCAN_RANGE          "192.168.178.0/24"
#define DEFAULT_PREFERRED_GATEWAY   "192.168.178.1"
#define DEFAULT_BACKUP_GATEWAY      "192.168.0.1"
#define DEFAULT_SCAN_TIMEOUT        (2000)      /* in milliseconds */
#define DEFAULT_RETRY_TIMEOUT       (2000)      /* in milliseconds */
#define DEFAULT_GATEWAY_TIMEOUT     (5000)      /* in milliseconds */
#define DEFAULT_DATA_FILE           "homebox_map_data.json"
#define DEFAULT_FAVOURITES_KEY      "fav_devices"
#define DEFAULT_MONITOR_PERIOD      (300)       /* in seconds */
#define DEFAULT_HTTP_PORT           (8080)
#define MAX_VERBOSITY               (2)

namespace {

std::string trim(const std::string &s)
{
    std::string out(s);
    out.erase(out.begin(), std::find_if(out.begin(), out.end(),
        [] (unsigned char c){ return !std::isspace(c); }));
    out.erase(std::find_if(out.rbegin(), out.rend(),
        [] (unsigned char c){ return !std::isspace(c); }).base(), out.end());
    return out;
}

bool parse_uint(const std::string &s, unsigned int &value)
{
    if (s.empty() || s.length() > 9)
        return false;

    for (unsigned int i = 0; i < s.length(); ++i) {
        if (s[i] < '0' || s[i] > '9')
            return false;
    }

    value = std::stoul(s);
    return true;
}

bool parse_list(const std::string &s, std::vector<std::string> &list)
{
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty())
            out.push_back(item);
    }

    if (out.empty())
        return false;

    list = out;
    return true;
}

}

Config::Config():
interface(),
scan_range(DEFAULT_SCAN_RANGE),
gateways({DEFAULT_PREFERRED_GATEWAY, DEFAULT_BACKUP_GATEWAY}),
scan_timeout_ms(DEFAULT_SCAN_TIMEOUT),
retry_timeout_ms(DEFAULT_RETRY_TIMEOUT),
gateway_timeout_ms(DEFAULT_GATEWAY_TIMEOUT),
data_file(DEFAULT_DATA_FILE),
favourites_key(DEFAULT_FAVOURITES_KEY),
log_dir(),
verbosity(1),
monitor_period_s(DEFAULT_MONITOR_PERIOD),
http_port(DEFAULT_HTTP_PORT)
{

}

bool set_config_value(Config &config, const std::string &key, const std::string &value)
{
    unsigned int n;

    if (key == "interface") {
        config.interface = value;
    } else if (key == "scan_range") {
        if (value.empty())
            return false;
        config.scan_range = value;
    } else if (key == "gateways") {
        return parse_list(value, config.gateways);
    } else if (key == "scan_timeout_ms") {
        if (!parse_uint(value, n))
            return false;
        config.scan_timeout_ms = n;
    } else if (key == "retry_timeout_ms") {
        if (!parse_uint(value, n))
            return false;
        config.retry_timeout_ms = n;
    } else if (key == "gateway_timeout_ms") {
        if (!parse_uint(value, n))
            return false;
        config.gateway_timeout_ms = n;
    } else if (key == "data_file") {
        if (value.empty())
            return false;
        config.data_file = value;
    } else if (key == "favourites_key") {
        if (value.empty())
            return false;
        config.favourites_key = value;
    } else if (key == "log_dir") {
        config.log_dir = value;
    } else if (key == "verbosity") {
        if (!parse_uint(value, n) || n > MAX_VERBOSITY)
            return false;
        config.verbosity = n;
    } else if (key == "monitor_period_s") {
        if (!parse_uint(value, n) || n == 0)
            return false;
        config.monitor_period_s = n;
    } else if (key == "http_port") {
        if (!parse_uint(value, n) || n == 0 || n > 65535)
            return false;
        config.http_port = n;
    } else {
        return false;
    }

    return true;
}

bool load_config(const std::string &path, Config &config)
{
    std::ifstream file(path);
    if (!file) {
        Logger::err("Could not load configuration from file " + path);
        return false;
    }

    std::string line;
    unsigned int lineno = 0;
    while (std::getline(file, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t ret = line.find('=');
        if (ret == std::string::npos) {
            std::stringstream msg;
            msg << path << ':' << lineno << ": ignoring line without '='";
            Logger::warn(msg.str());
            continue;
        }

        std::string key = trim(line.substr(0, ret));
        std::string val = trim(line.substr(ret + 1));
        if (!set_config_value(config, key, val)) {
            std::stringstream msg;
            msg << path << ':' << lineno << ": invalid setting \"" << key << "\" = \"" << val << '"';
            Logger::warn(msg.str());
        }
    }

    return true;
}
