#include "server/http_server.hpp"

#include <functional>

#include "server/api_handlers.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::server {
namespace {

void LogCompletion(int status, const std::string& request_id, double duration_ms) {
    const utils::LogFields fields = {
        {"request_id", request_id},
        {"status_code", std::to_string(status)},
        {"duration_ms", utils::FormatFixed(duration_ms, 2)}
    };
    if (status >= 200 && status < 300) {
        utils::LogInfo("http", "request completed successfully", fields);
    } else if (status >= 400 && status < 500) {
        utils::LogWarn("http", "request failed with client error", fields);
    } else if (status >= 500) {
        utils::LogError("http", "request failed with server error", fields);
    } else {
        utils::LogInfo("http", "request completed", fields);
    }
}

// Wraps a handler with request-id tagging, timing headers and access logs.
void Respond(const httplib::Request& req,
             httplib::Response& res,
             const std::function<JsonReply()>& handler) {
    const auto started = std::chrono::steady_clock::now();
    const auto request_id = utils::GenerateUuid();
    utils::LogInfo("http", "received request", {
        {"request_id", request_id},
        {"method", req.method},
        {"path", req.path},
        {"remote_addr", req.remote_addr},
        {"content_length", std::to_string(req.body.size())}
    });

    JsonReply reply;
    try {
        reply = handler();
    } catch (const std::exception& ex) {
        utils::LogError("http", "unhandled error", {{"request_id", request_id}, {"error", ex.what()}});
        reply.status = 500;
        reply.body = {{"error", "Internal server error"}};
    }
    if (reply.body.is_object()) {
        reply.body["request_id"] = request_id;
    }

    const auto duration = std::chrono::steady_clock::now() - started;
    const auto seconds = std::chrono::duration<double>(duration).count();
    res.status = reply.status;
    res.set_header("X-Request-Id", request_id);
    res.set_header("X-Response-Time", utils::FormatFixed(seconds, 6));
    res.set_content(reply.body.dump(), "application/json");
    LogCompletion(reply.status, request_id, seconds * 1000.0);
}

}  // namespace

HttpServer::HttpServer(config::Config config, const sandbox::SandboxExecutor& executor)
    : config_(std::move(config))
    , executor_(executor)
    , started_(std::chrono::steady_clock::now()) {
    RegisterRoutes();
}

void HttpServer::RegisterRoutes() {
    server_.Post("/run", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(req, res, [this, &req]() { return HandleRun(req.body, executor_); });
    });
    server_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(req, res, [this]() { return HandleHealth(config_, started_); });
    });
    server_.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        Respond(req, res, [this]() { return HandleServiceInfo(config_); });
    });
}

bool HttpServer::Listen() {
    utils::LogInfo("http", "listening",
                   {{"host", config_.server.host}, {"port", std::to_string(config_.server.port)}});
    const bool ok = server_.listen(config_.server.host, config_.server.port);
    if (!ok) {
        utils::LogError("http", "server failed to listen",
                        {{"host", config_.server.host}, {"port", std::to_string(config_.server.port)}});
    }
    return ok;
}

void HttpServer::Stop() {
    server_.stop();
}

}  // namespace runbox::server
