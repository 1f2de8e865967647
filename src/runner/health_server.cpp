#include "health_server.hpp"
#include <iostream>
#include <stdexcept>

HealthServer::HealthServer(const QueueConsumer& consumer, std::atomic<bool>& force_flush)
    : consumer_(consumer)
    , force_flush_(force_flush) {
}

HealthServer::~HealthServer() {
    stop();
}

void HealthServer::setupRoutes(crow::SimpleApp& app) {
    CROW_ROUTE(app, "/health")
    ([]() {
        return crow::response(200, "OK");
    });

    CROW_ROUTE(app, "/ready")
    ([this]() {
        if (consumer_.getStats().assigned_partitions.load() == 0) {
            return crow::response(503, "No partitions assigned");
        }
        return crow::response(200, "OK");
    });

    // The polling thread owns the task; this only raises the flag it checks
    CROW_ROUTE(app, "/flush").methods("POST"_method)
    ([this]() {
        std::cout << "Force flush requested via HTTP endpoint" << std::endl;
        force_flush_ = true;
        return crow::response(202, "Flush scheduled (offsets are committed after upload)");
    });

    CROW_ROUTE(app, "/stats")
    ([this]() {
        const ConsumerStats& s = consumer_.getStats();
        crow::json::wvalue stats;
        stats["records_consumed"] = s.records_consumed.load();
        stats["batches_consumed"] = s.batches_consumed.load();
        stats["buffered_records"] = s.buffered_records.load();
        stats["assigned_partitions"] = s.assigned_partitions.load();
        stats["offset_commits"] = s.offset_commits.load();
        stats["flush_retries"] = s.flush_retries.load();
        stats["last_commit_epoch_ms"] = s.last_commit_epoch_ms.load();
        return crow::response(200, stats);
    });
}

void HealthServer::start(int port) {
    if (thread_.joinable()) {
        throw std::logic_error("Health server is already running");
    }
    setupRoutes(app_);

    std::cout << "Sink health server running on port " << port << std::endl;
    std::cout << "  POST /flush - Force flush buffered records to S3" << std::endl;
    std::cout << "  GET /stats - Get consumer statistics" << std::endl;
    std::cout << "  GET /health - Health check" << std::endl;

    thread_ = std::thread([this, port]() {
        app_.port(port).multithreaded().run();
    });
}

void HealthServer::stop() {
    if (!thread_.joinable()) {
        return;
    }
    app_.wait_for_server_start();
    app_.stop();
    thread_.join();
    std::cout << "Sink health server stopped" << std::endl;
}
