/**
 * @file HttpHost.hpp
 * @brief Thin JSON-over-HTTP binding of the application services.
 */

#pragma once

#include <memory>
#include <string>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace httplib {
class Server;
}

namespace mindshield::app {

/**
 * @class HttpHost
 * @brief Owns the cpp-httplib server and maps routes onto the services.
 * Request parsing and error-to-status mapping live here; the services never
 * see HTTP.
 */
class HttpHost {
public:
    HttpHost(application::AppServices& services, infrastructure::ShieldSettings settings);
    ~HttpHost();

    /**
     * @brief Binds the listening socket. Port 0 in the settings picks a free
     * port.
     * @return The bound port, or -1 on failure.
     */
    int bind();

    /** @brief Binds if needed, then blocks until stop() is called. */
    bool run();
    void stop();

    int port() const { return m_boundPort; }

private:
    void registerRoutes();

    application::AppServices& m_services;
    infrastructure::ShieldSettings m_settings;
    std::unique_ptr<httplib::Server> m_server;
    int m_boundPort = -1;
};

} // namespace mindshield::app
