#ifndef DEVICE_TRACKER_HPP
#define DEVICE_TRACKER_HPP

#include "config.hpp"
#include "errors.hpp"
#include "favourites.hpp"
#include "gateway_checker.hpp"
#include "prober.hpp"
#include "reconciler.hpp"
#include "store.hpp"
#include "timer.hpp"
#include <mutex>
#include <string>

#define EXIT_PASS_DONE          (0)
#define EXIT_WRONG_GATEWAY      (1)
#define EXIT_NO_GATEWAY         (2)

class DeviceTracker {
public:
    DeviceTracker(const Config &config, Prober &prober, Store &store);

    DeviceTracker(const DeviceTracker&) = delete;
    DeviceTracker& operator=(const DeviceTracker&) = delete;

    /**
     * @brief Find the first reachable gateway
     *
     * @param gateway set to the gateway that answered
     * @return RESULT_NONE_REACHABLE if no gateway answered
     */
    ResultCode checkGateways(std::string &gateway);

    /* Scan and reconcile once, log the outcome of every favourite */
    ReconcileReport runPass();

    /**
     * @brief Check the gateways and run a pass only behind the preferred one
     *
     * @param report set to the pass outcome when a pass ran
     * @return EXIT_PASS_DONE, EXIT_WRONG_GATEWAY if only a backup gateway
     * answered or EXIT_NO_GATEWAY if none answered
     */
    int runDefault(ReconcileReport &report);

    FavouriteManager& getFavourites();
    Reconciler& getReconciler();

    /* Run a first pass now, then one every monitor_period_s */
    void startMonitor();

    /* Wait up to timeout_ms for the monitor timer and run a pass when it fires */
    void process(int timeout_ms = 1000);
    void stopMonitor();

    /*
     * Beware this function is called from the web server thread !
     */
    std::string buildWebpage();

private:
    void monitorPass();
    void logReport(const ReconcileReport &report);

    const Config &m_config;
    FavouriteManager m_favourites;
    Reconciler m_reconciler;
    GatewayChecker m_gateway_checker;
    Timer m_pass_timer;

    std::mutex m_state_mutex;
    bool m_has_report;
    ReconcileReport m_last_report;
    std::string m_gateway;
    unsigned long long m_pass_count;
};

#endif
