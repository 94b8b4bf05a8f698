#include <algorithm>
#include <csignal>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "address_range.hpp"
#include "arp_prober.hpp"
#include "config.hpp"
#include "device_tracker.hpp"
#include "json_store.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "version.hpp"
#include "web_server.hpp"

namespace {

volatile sig_atomic_t running = 1;

void handle_signal(int sig)
{
    (void) sig;
    running = 0;
}

}

static void print_help(char *program_name)
{
    std::cout << "Usage: " << program_name << " [options] [command]\n"
              << "Options:\n"
              << "    --config <file>                   Load configuration file\n"
              << "    --data-file <file>                Favourites JSON file\n"
              << "    --interface <name>                Network interface\n"
              << "    --range <range>                   Scan range (a.b.c.d/n or a.b.c.d-e)\n"
              << "    --log-dir <dir>                   Mirror logs to files in dir\n"
              << "    --verbose <level>                 0, 1 or 2\n"
              << "    --version, -v                     Print version\n"
              << "    --help, -h                        Print help\n"
              << "Commands:\n"
              << "    (none)                            Check gateway and report online favourites\n"
              << "    scan                              Print every device in the scan range\n"
              << "    list                              Print stored favourites\n"
              << "    save <name> <ip> [mac]            Save a favourite\n"
              << "    delete <name>                     Delete all favourites with that name\n"
              << "    backup [file]                     Copy the data file\n"
              << "    monitor                           Periodic passes with a status web page\n"
              << std::flush;
}

static int run_default(DeviceTracker &tracker)
{
    ReconcileReport report;
    int ret = tracker.runDefault(report);
    if (ret == EXIT_NO_GATEWAY) {
        std::cout << "No gateway reachable." << std::endl;
        return ret;
    }
    if (ret == EXIT_WRONG_GATEWAY) {
        std::cout << "Wrong gateway." << std::endl;
        return ret;
    }

    std::cout << "\nOnline devices:\n";
    for (auto &f : report.online)
        std::cout << favourite_to_string(f) << '\n';
    std::cout << std::flush;

    return ret;
}

static int run_scan(DeviceTracker &tracker)
{
    Snapshot devices = tracker.getReconciler().scan();

    std::sort(devices.begin(), devices.end(),
        [] (const Device &a, const Device &b) {
            uint32_t x = 0, y = 0;
            parse_ipv4(a.address, x);
            parse_ipv4(b.address, y);
            return x < y;
        });

    for (auto &d : devices)
        std::cout << d.hw_address << ' ' << d.address << '\n';
    std::cout << std::flush;

    return 0;
}

static int run_list(DeviceTracker &tracker)
{
    std::vector<FavouriteRecord> favourites = tracker.getFavourites().loadFavourites();
    if (favourites.empty())
        std::cout << "No favourites" << std::endl;

    for (auto &f : favourites)
        std::cout << favourite_to_string(f) << '\n';
    std::cout << std::flush;

    return 0;
}

static int run_backup(DeviceTracker &tracker, const Config &config, const std::string &destination)
{
    std::string path = destination;
    if (path.empty())
        path = backup_path(config.data_file, time(nullptr));

    JsonFileStore backup_store(path);
    ResultCode ret = tracker.getFavourites().backup(backup_store);
    if (ret != RESULT_OK) {
        std::cout << "Backup of " << config.data_file << " failed: " << result_code_str(ret) << std::endl;
        return 1;
    }

    std::cout << "Backup of " << config.data_file << " saved to " << path << std::endl;
    return 0;
}

static int run_monitor(DeviceTracker &tracker, const Config &config)
{
    signal(SIGINT, handle_signal);
    signal(SIGTERM, handle_signal);

    WebServer web_server(&tracker, config.http_port);
    web_server.start();

    tracker.startMonitor();
    while (running)
        tracker.process();

    tracker.stopMonitor();
    web_server.stop();

    return 0;
}

int main(int argc, char **argv)
{
    char *program_name = argv[0];
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> args;

    argc--;
    argv++;
    while (argc) {
        std::string opt(argv[0]);
        if (opt == "--config" && argc >= 2) {
            config_path = argv[1];
            argc--;
            argv++;
        } else if (opt == "--data-file" && argc >= 2) {
            overrides.emplace_back("data_file", argv[1]);
            argc--;
            argv++;
        } else if (opt == "--interface" && argc >= 2) {
            overrides.emplace_back("interface", argv[1]);
            argc--;
            argv++;
        } else if (opt == "--range" && argc >= 2) {
            overrides.emplace_back("scan_range", argv[1]);
            argc--;
            argv++;
        } else if (opt == "--log-dir" && argc >= 2) {
            overrides.emplace_back("log_dir", argv[1]);
            argc--;
            argv++;
        } else if (opt == "--verbose" && argc >= 2) {
            overrides.emplace_back("verbosity", argv[1]);
            argc--;
            argv++;
        } else if (opt == "--help" || opt == "-h") {
            print_help(program_name);
            return 0;
        } else if (opt == "--version" || opt == "-v") {
            std::cout << get_version_str() << std::endl;
            return 0;
        } else if (opt.rfind("--", 0) == 0) {
            std::cerr << "Invalid option: \"" << opt << '\"' << std::endl;
            print_help(program_name);
            return -1;
        } else {
            args.push_back(opt);
        }

        argc--;
        argv++;
    }

    Config config;
    if (!config_path.empty() && !load_config(config_path, config))
        return -1;

    for (auto &o : overrides) {
        if (!set_config_value(config, o.first, o.second)) {
            std::cerr << "Invalid value \"" << o.second << "\" for " << o.first << std::endl;
            print_help(program_name);
            return -1;
        }
    }

    std::string command = args.empty() ? std::string() : args[0];
    size_t nargs = args.empty() ? 0 : args.size() - 1;
    bool valid = (command.empty() && nargs == 0)
              || ((command == "scan" || command == "list" || command == "monitor") && nargs == 0)
              || (command == "save" && (nargs == 2 || nargs == 3))
              || (command == "delete" && nargs == 1)
              || (command == "backup" && nargs <= 1);
    if (!valid) {
        std::cerr << "Invalid command" << std::endl;
        print_help(program_name);
        return -1;
    }

    Logger::instance().setLevel(static_cast<LogLevel>(config.verbosity));
    if (!config.log_dir.empty())
        Logger::instance().startLogging(config.log_dir);
    {
        std::stringstream ss;
        ss << program_name << " (version: " << get_version_str() << ") started";
        Logger::debug(ss.str());
    }

    int ret;
    try {
        ArpProber prober(config.interface);
        JsonFileStore store(config.data_file);
        DeviceTracker tracker(config, prober, store);

        if (command.empty()) {
            prober.open();
            ret = run_default(tracker);
        } else if (command == "scan") {
            prober.open();
            ret = run_scan(tracker);
        } else if (command == "list") {
            ret = run_list(tracker);
        } else if (command == "save") {
            std::string mac = nargs == 3 ? args[3] : std::string();
            if (mac.empty())
                prober.open();
            ret = tracker.getFavourites().saveFavourite(args[1], args[2], mac) == RESULT_OK ? 0 : 1;
        } else if (command == "delete") {
            ret = tracker.getFavourites().deleteFavourite(args[1]) ? 0 : 1;
        } else if (command == "backup") {
            ret = run_backup(tracker, config, nargs == 1 ? args[1] : std::string());
        } else {
            prober.open();
            ret = run_monitor(tracker, config);
        }
    } catch (const std::runtime_error &e) {
        Logger::err(e.what());
        ret = -1;
    }

    Logger::instance().stopLogging();

    return ret;
}
