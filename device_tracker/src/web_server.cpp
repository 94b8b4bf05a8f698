#include <microhttpd.h>
#include <stdexcept>
#include <sstream>
#include <string>
#include "logger.hpp"
#include "web_server.hpp"

/* Handlers return enum MHD_Result since libmicrohttpd 0.9.71 */
#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result mhd_result_t;
#else
typedef int mhd_result_t;
#endif

namespace {

mhd_result_t answerConnection(void *cls, struct MHD_Connection *connection,
                              const char *url, const char *method,
                              const char *version, const char *upload_data,
                              size_t *upload_data_size, void **con_cls)
{
    struct MHD_Response *response;
    mhd_result_t ret;
    DeviceTracker *t = reinterpret_cast<DeviceTracker*>(cls);
    (void) version;           /* Unused. Silent compiler warning. */
    (void) upload_data;       /* Unused. Silent compiler warning. */
    (void) upload_data_size;  /* Unused. Silent compiler warning. */
    (void) con_cls;           /* Unused. Silent compiler warning. */

    std::string m(method);
    std::string u(url);
    std::string page;
    unsigned int status;
    if (m != "GET" && m != "HEAD") {
        page = "Method not allowed\n";
        status = MHD_HTTP_METHOD_NOT_ALLOWED;
    } else if (u != "/") {
        page = "Not found\n";
        status = MHD_HTTP_NOT_FOUND;
    } else {
        page = t->buildWebpage();
        status = MHD_HTTP_OK;
    }

    response = MHD_create_response_from_buffer(page.length(),
                                               const_cast<char*>(page.c_str()),
                                               MHD_RESPMEM_MUST_COPY);
    if (!response)
        return MHD_NO;

    if (status == MHD_HTTP_OK)
        MHD_add_response_header(response, MHD_HTTP_HEADER_CONTENT_TYPE, "text/html; charset=utf-8");
    ret = MHD_queue_response(connection, status, response);
    MHD_destroy_response(response);

    return ret;
}

}

WebServer::WebServer(DeviceTracker *t, unsigned int port):
m_tracker(t),
m_port(port),
m_daemon(nullptr)
{

}

WebServer::~WebServer()
{
    if (m_daemon)
        stop();
}

void WebServer::start()
{
    if (m_daemon) {
        Logger::warn("Attempted to start already running web server");
        return;
    }

    m_daemon = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                                m_port, NULL, NULL,
                                answerConnection, m_tracker, MHD_OPTION_END);

    if (!m_daemon) {
        std::stringstream ss;
        ss << "Failed to start web server on port " << m_port;
        Logger::err(ss.str());
        throw std::runtime_error(ss.str());
    } else {
        std::stringstream ss;
        ss << "Web server started. Listening on port " << m_port;
        Logger::info(ss.str());
    }
}

void WebServer::stop()
{
    if (m_daemon) {
        MHD_stop_daemon(m_daemon);
        m_daemon = nullptr;
        Logger::info("Web server stopped");
    } else {
        Logger::warn("Attempted to stop already stopped web server");
    }
}
