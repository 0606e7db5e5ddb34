/**
 * @file RegistryHttpServer.hpp
 * @brief JSON-over-HTTP adapter for ParasiteRegistryService.
 */

#pragma once

#include <memory>
#include <string>

#include "application/registry/ParasiteRegistryService.hpp"

namespace httplib {
class Server;
}

namespace parasitereg::infrastructure::http {

/**
 * @class RegistryHttpServer
 * @brief Maps the public operation surface onto REST routes.
 *
 * The caller identity comes from the X-Caller-Identity header; the gateway in
 * front of this server is responsible for authenticating it.
 */
class RegistryHttpServer {
public:
    static constexpr const char* CallerHeader = "X-Caller-Identity";

    explicit RegistryHttpServer(std::shared_ptr<application::registry::ParasiteRegistryService> service);
    ~RegistryHttpServer();

    /** @brief Blocks serving requests until stop() is called. Returns false if binding failed. */
    bool listen(const std::string& host, int port);

    void stop();

    /** @brief HTTP status used for a registry error kind. */
    static int StatusFor(domain::registry::ErrorKind kind);

private:
    void registerRoutes();

    std::shared_ptr<application::registry::ParasiteRegistryService> m_service;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace parasitereg::infrastructure::http
