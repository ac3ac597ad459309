#include "sentinel/http_server.hpp"
#include "sentinel/logging.hpp"
#include "sentinel/serialization.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace sentinel {

namespace {

void send_json(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

} // namespace

HttpServer::HttpServer(ControlSurface& surface)
    : surface_(surface),
      server_(std::make_unique<httplib::Server>()),
      logger_(make_logger("http_server")) {
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, surface_.get_health());
    });

    server_->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, surface_.get_metrics());
    });

    server_->Get("/config", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, surface_.effective_configuration());
    });

    server_->Get("/qualified-stocks", [this](const httplib::Request&, httplib::Response& res) {
        auto candidates = surface_.list_candidates();
        send_json(res, {{"count", candidates.size()}, {"stocks", candidates}});
    });

    server_->Post("/emergency-stop", [this](const httplib::Request& req, httplib::Response& res) {
        std::string reason = "MANUAL_STOP";
        StopOrigin origin = StopOrigin::Dashboard;
        if (!req.body.empty()) {
            nlohmann::json body;
            try {
                body = nlohmann::json::parse(req.body);
            } catch (const nlohmann::json::parse_error& e) {
                logger_->warn("Malformed emergency-stop body: {}", e.what());
                send_json(res, {{"error", "malformed JSON body"}, {"message", e.what()}}, 400);
                return;
            }
            if (!body.is_object()) {
                send_json(res, {{"error", "body must be a JSON object"}}, 400);
                return;
            }
            if (body.contains("reason")) {
                if (!body["reason"].is_string()) {
                    send_json(res, {{"error", "reason must be a string"}}, 400);
                    return;
                }
                reason = body["reason"].get<std::string>();
            }
            if (body.contains("origin")) {
                std::optional<StopOrigin> parsed;
                if (body["origin"].is_string()) {
                    parsed = parse_stop_origin(body["origin"].get<std::string>());
                }
                if (!parsed) {
                    send_json(res, {{"error", "unknown origin"}}, 400);
                    return;
                }
                origin = *parsed;
            }
        }

        bool accepted = surface_.trigger_emergency_stop(reason, origin);
        send_json(res, {
            {"acknowledged", true},
            {"accepted", accepted},
            {"reason", reason},
            {"origin", to_string(origin)}
        });
    });

    // Ping endpoint for health checks
    server_->Get("/ping", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("pong", "text/plain");
    });

    // Error handler
    server_->set_exception_handler([this](const auto&, auto& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            logger_->error("Request failed: {}", e.what());
            send_json(res, {{"error", "Internal server error"}, {"message", e.what()}}, 500);
        }
    });
}

bool HttpServer::start(const std::string& host, int port) {
    logger_->info("Starting HTTP server on {}:{}", host, port);
    if (!server_->bind_to_port(host, port)) {
        logger_->error("Failed to bind HTTP server on {}:{}", host, port);
        return false;
    }
    serve(host, port);
    return true;
}

int HttpServer::start_on_any_port(const std::string& host) {
    int port = server_->bind_to_any_port(host);
    if (port < 0) {
        logger_->error("Failed to bind HTTP server on {}", host);
        return -1;
    }
    serve(host, port);
    return port;
}

void HttpServer::serve(const std::string& host, int port) {
    thread_ = std::thread([this, host, port] {
        if (!server_->listen_after_bind()) {
            logger_->error("HTTP server on {}:{} stopped listening", host, port);
        }
    });
    logger_->info("HTTP server listening on {}:{}", host, port);
}

void HttpServer::stop() {
    if (!thread_.joinable()) {
        return;
    }
    logger_->info("Stopping HTTP server");
    server_->stop();
    thread_.join();
}

} // namespace sentinel
