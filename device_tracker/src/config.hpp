#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <vector>

struct Config {
    Config();

    std::string interface;              /* empty: first IPv4 interface that is up */
    std::string scan_range;
    std::vector<std::string> gateways;  /* preferred gateway first */
    unsigned int scan_timeout_ms;
    unsigned int retry_timeout_ms;
    unsigned int gateway_timeout_ms;
    std::string data_file;
    std::string favourites_key;
    std::string log_dir;                /* empty: log to stdout only */
    unsigned int verbosity;
    unsigned int monitor_period_s;
    unsigned int http_port;
};

/*
 * Read key=value lines from path into config.
 *
 * Blank lines and lines starting with '#' are skipped. Unknown keys
 * and invalid values are reported and ignored.
 * Returns false if the file cannot be opened.
 */
bool load_config(const std::string &path, Config &config);

/*
 * Apply a single setting. Returns false if key is unknown or
 * value is invalid for that key.
 */
bool set_config_value(Config &config, const std::string &key, const std::string &value);

#endif
