#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include <microhttpd.h>
#include "device_tracker.hpp"

class WebServer {
public:
    WebServer(DeviceTracker *t, unsigned int port);
    ~WebServer();

    WebServer(const WebServer&) = delete;
    WebServer& operator=(const WebServer&) = delete;

    void start();
    void stop();

private:

    DeviceTracker *m_tracker;
    unsigned int m_port;
    struct MHD_Daemon *m_daemon;
};

#endif
