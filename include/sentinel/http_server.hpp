#pragma once

#include "control_surface.hpp"

#include <memory>
#include <string>
#include <thread>
#include <spdlog/spdlog.h>

namespace httplib {
class Server;
}

namespace sentinel {

// JSON endpoints over the control surface:
//   GET  /health  /metrics  /config  /qualified-stocks  /ping
//   POST /emergency-stop {"reason": "...", "origin": "dashboard"}
class HttpServer {
public:
    explicit HttpServer(ControlSurface& surface);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds and serves on a background thread. Returns false when the
    // address cannot be bound.
    bool start(const std::string& host, int port);
    // Binds to a port chosen by the OS. Returns the port, or -1.
    int start_on_any_port(const std::string& host);
    void stop();

private:
    ControlSurface& surface_;
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::shared_ptr<spdlog::logger> logger_;

    void setup_routes();
    void serve(const std::string& host, int port);
};

} // namespace sentinel
