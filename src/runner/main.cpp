#include "health_server.hpp"
#include "queue_consumer.hpp"
#include "../config.hpp"
#include "../sink/s3_sink_task.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

std::atomic<bool> g_running(true);
std::atomic<bool> g_force_flush(false);

void signalHandler(int signal) {
    if (signal == SIGUSR1) {
        g_force_flush = true;
    } else {
        g_running = false;
    }
}

int main() {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGUSR1, signalHandler);  // Force flush signal

        SinkConfig config = SinkConfig::fromEnv();

        int health_port = 8080;
        const char* health_port_str = std::getenv("HEALTH_PORT");
        if (health_port_str) {
            health_port = std::atoi(health_port_str);
        }

        S3SinkTask task;
        task.start(config.props);

        QueueConsumer consumer(task.getConfig(), task, g_running, g_force_flush);
        if (!consumer.initialize()) {
            std::cerr << "Failed to initialize queue consumer" << std::endl;
            return 1;
        }

        // Declared after the consumer so it is stopped before the consumer is destroyed
        HealthServer health_server(consumer, g_force_flush);
        health_server.start(health_port);

        std::cout << "S3 sink started successfully" << std::endl;
        std::cout << "Rotation: flush.size=" << config.flush_size
                  << ", rotate.interval.ms=" << config.rotate_interval_ms
                  << ", rotate.schedule.interval.ms=" << config.rotate_schedule_interval_ms << std::endl;
        std::cout << "Send SIGUSR1 to force flush (kill -USR1 <pid>)" << std::endl;

        consumer.start();

        std::cout << "Shutting down..." << std::endl;
        health_server.stop();
        consumer.stop();
        task.stop();
        std::cout << "S3 sink stopped" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        std::cerr << "Please set required environment variables:" << std::endl;
        std::cerr << "  KAFKA_BROKERS - Comma-separated list of broker addresses" << std::endl;
        std::cerr << "  KAFKA_TOPICS - Comma-separated list of topics to sink" << std::endl;
        std::cerr << "  S3_ENDPOINT - S3-compatible storage endpoint (http:// or https://)" << std::endl;
        std::cerr << "  S3_BUCKET - Existing bucket to write objects into" << std::endl;
        std::cerr << "  FLUSH_SIZE - Records per committed object" << std::endl;
        std::cerr << "Optional:" << std::endl;
        std::cerr << "  KAFKA_CONSUMER_GROUP - Consumer group name (default: 's3-sink')" << std::endl;
        std::cerr << "  S3_ACCESS_KEY / S3_SECRET_KEY - Static credentials" << std::endl;
        std::cerr << "  S3_REGION - Bucket region (default: us-east-1)" << std::endl;
        std::cerr << "  S3_PART_SIZE - Multipart part size in bytes (default: 26214400)" << std::endl;
        std::cerr << "  TOPICS_DIR - Top-level prefix for objects (default: topics)" << std::endl;
        std::cerr << "  FORMAT_CLASS - bytearray, json or parquet (default: bytearray)" << std::endl;
        std::cerr << "  PARTITIONER_CLASS - default, time, hourly or daily (default: default)" << std::endl;
        std::cerr << "  PARTITION_DURATION_MS / PATH_FORMAT - Settings for the time partitioner" << std::endl;
        std::cerr << "  ROTATE_INTERVAL_MS - Record time span per object (default: disabled)" << std::endl;
        std::cerr << "  ROTATE_SCHEDULE_INTERVAL_MS - Wall clock time per object (default: disabled)" << std::endl;
        std::cerr << "  MAX_RETRIES / RETRY_BACKOFF_MS - Flush retry policy (default: 5 / 500)" << std::endl;
        std::cerr << "  HEALTH_PORT - Health/flush endpoint port (default: 8080)" << std::endl;
        return 1;
    }

    return 0;
}
