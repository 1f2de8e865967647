#ifndef HEALTH_SERVER_HPP
#define HEALTH_SERVER_HPP

#include "queue_consumer.hpp"
#include "crow.h"
#include <atomic>
#include <thread>

// Health, readiness, stats and manual flush endpoints for the sink process.
// Owns its serving thread; stop() (or destruction) joins it, so the server
// never outlives the consumer it reports on.
class HealthServer {
public:
    HealthServer(const QueueConsumer& consumer, std::atomic<bool>& force_flush);
    ~HealthServer();

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    void start(int port);
    void stop();

    // Setup routes on the provided app (for testing)
    void setupRoutes(crow::SimpleApp& app);

private:
    const QueueConsumer& consumer_;
    std::atomic<bool>& force_flush_;
    crow::SimpleApp app_;
    std::thread thread_;
};

#endif // HEALTH_SERVER_HPP
