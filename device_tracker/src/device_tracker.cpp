#include "device_tracker.hpp"
#include "logger.hpp"
#include "report.hpp"
#include "version.hpp"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <time.h>

DeviceTracker::DeviceTracker(const Config &config, Prober &prober, Store &store):
m_config(config),
m_favourites(store, prober, config),
m_reconciler(prober, m_favourites, config),
m_gateway_checker(prober, config),
m_pass_timer(),
m_state_mutex(),
m_has_report(false),
m_last_report(),
m_gateway(),
m_pass_count(0)
{

}

ResultCode DeviceTracker::checkGateways(std::string &gateway)
{
    if (!m_gateway_checker.findReachable(gateway))
        return RESULT_NONE_REACHABLE;

    return RESULT_OK;
}

ReconcileReport DeviceTracker::runPass()
{
    ReconcileReport report = m_reconciler.runPass(time(nullptr));
    logReport(report);

    std::lock_guard<std::mutex> guard(m_state_mutex);
    m_last_report = report;
    m_has_report = true;
    m_pass_count++;

    return report;
}

int DeviceTracker::runDefault(ReconcileReport &report)
{
    std::string gateway;
    if (checkGateways(gateway) != RESULT_OK)
        return EXIT_NO_GATEWAY;

    if (gateway != m_config.gateways.front()) {
        Logger::warn("Preferred gateway " + m_config.gateways.front() + " not reachable, found " + gateway);
        return EXIT_WRONG_GATEWAY;
    }

    report = runPass();
    return EXIT_PASS_DONE;
}

FavouriteManager& DeviceTracker::getFavourites()
{
    return m_favourites;
}

Reconciler& DeviceTracker::getReconciler()
{
    return m_reconciler;
}

void DeviceTracker::logReport(const ReconcileReport &report)
{
    for (auto &e : report.events)
        Logger::info(event_to_string(e));

    std::stringstream ss;
    ss << report.online.size() << " of " << report.events.size() << " favourites online";
    Logger::info(ss.str());

    if (!report.saved)
        Logger::err("Favourites were not saved");
}

void DeviceTracker::startMonitor()
{
    std::stringstream ss;
    ss << "Monitoring " << m_config.scan_range << " every " << m_config.monitor_period_s << "s";
    Logger::info(ss.str());

    monitorPass();
    m_pass_timer.start(m_config.monitor_period_s * 1000, true);
}

void DeviceTracker::stopMonitor()
{
    m_pass_timer.stop();
    Logger::info("Monitor stopped");
}

void DeviceTracker::process(int timeout_ms)
{
    struct pollfd fds[1];

    fds[0].fd = m_pass_timer.getFD();
    fds[0].events = POLLIN;
    fds[0].revents = 0;

    int ret = poll(fds, sizeof(fds)/sizeof(fds[0]), timeout_ms);
    if (ret < 0) {
        if (errno != EINTR) {
            std::stringstream ss;
            ss << "Failed to poll monitor timer: " << strerror(errno);
            Logger::err(ss.str());
        }
        return;
    }

    if (ret > 0 && m_pass_timer.consume() > 0)
        monitorPass();
}

void DeviceTracker::monitorPass()
{
    std::string gateway;
    if (checkGateways(gateway) != RESULT_OK) {
        Logger::warn("No gateway reachable, skipping pass");
        std::lock_guard<std::mutex> guard(m_state_mutex);
        m_gateway.clear();
        return;
    }

    if (gateway != m_config.gateways.front())
        Logger::warn("Wrong gateway, using " + gateway);

    {
        std::lock_guard<std::mutex> guard(m_state_mutex);
        m_gateway = gateway;
    }

    runPass();
}

std::string DeviceTracker::buildWebpage()
{
    std::stringstream ss;

    ss << "<html><head>\
        <meta http-equiv=\"refresh\" content=\"60\">\
        <style>\
        table, td, th {\
        border: 1px solid black;\
        }\
        table {\
        width: 100%;\
        border-collapse: collapse;\
        }\
        </style>\
        <title>Device tracker</title>\
        </head><body>";

    ss << "<h1>Device tracker</h1>";
    ss << "Software version: " << html_escape(get_version_str());
    ss << "<br>";
    ss << "Scan range: " << html_escape(m_config.scan_range);
    ss << "<br>";

    std::lock_guard<std::mutex> guard(m_state_mutex);

    ss << "Gateway: ";
    if (m_gateway.empty())
        ss << "<span style=\"color:red\">none reachable</span>";
    else
        ss << html_escape(m_gateway);
    ss << "<br>";

    if (!m_has_report) {
        ss << "No pass completed yet";
        ss << "</body></html>";
        return ss.str();
    }

    ss << "Last pass: " << format_timestamp(m_last_report.timestamp)
       << " (" << m_pass_count << " passes)";
    if (!m_last_report.saved)
        ss << " <span style=\"color:red\">not saved</span>";
    ss << "<br>";

    ss << "<h2>Online</h2>";
    if (m_last_report.online.empty()) {
        ss << "No favourite online";
    } else {
        ss << "<ul>";
        for (auto &f : m_last_report.online)
            ss << "<li>" << html_escape(favourite_to_string(f)) << "</li>";
        ss << "</ul>";
    }

    ss << "<h2>Last pass</h2>";
    ss << "<ul>";
    for (auto &e : m_last_report.events)
        ss << "<li>" << html_escape(event_to_string(e)) << "</li>";
    ss << "</ul>";

    ss << "<h2>Favourites</h2>";
    ss << "<table>";
    ss << "<tr>";
    ss << "<th>Name</th>";
    ss << "<th>IP address</th>";
    ss << "<th>MAC address</th>";
    ss << "<th>Last seen</th>";
    ss << "</tr>";
    for (auto &f : m_last_report.updated) {
        ss << "<tr>";
        ss << "<td>" << html_escape(f.name) << "</td>";
        ss << "<td>" << html_escape(f.address) << "</td>";
        ss << "<td>" << html_escape(f.hw_address) << "</td>";
        ss << "<td>" << format_timestamp(f.last_seen) << "</td>";
        ss << "</tr>";
    }
    ss << "</table>";

    ss << "</body></html>";

    return ss.str();
}
