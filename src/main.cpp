#include <iostream>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>
#include "config/SchedulerConfig.h"
#include "database/PostgresDirectory.h"
#include "services/StatusLifecycleManager.h"

namespace {

volatile std::sig_atomic_t stopRequested = 0;

void handleSignal(int) {
    stopRequested = 1;
}

std::string getCurrentTimeISO() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

void sleepUntilNextSweep(int intervalSeconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(intervalSeconds);
    while (!stopRequested && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

} // namespace

int main() {
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    SchedulerConfig config;
    try {
        config = loadConfigFromEnv();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    PostgresDirectory& directory = PostgresDirectory::getInstance();
    if (!directory.connect(config.database_url)) {
        std::cerr << "Failed to connect to database" << std::endl;
        return 1;
    }

    StatusLifecycleManager lifecycle(directory);
    int exitCode = 0;

    try {
        if (config.create_schema) {
            directory.createSchema();
            std::cout << "Reviewer schema is in place" << std::endl;
        }

        std::cout << "Reviewer status sweeper started, timeout " << config.status_timeout_days
                  << " day(s)" << std::endl;

        do {
            int reset = lifecycle.resetStaleStatus(config.status_timeout_days);
            std::cout << getCurrentTimeISO() << " reset " << reset
                      << " stale reviewer status(es)" << std::endl;

            if (config.sweep_interval_seconds > 0) {
                sleepUntilNextSweep(config.sweep_interval_seconds);
            }
        } while (config.sweep_interval_seconds > 0 && !stopRequested);

    } catch (const std::exception& e) {
        std::cerr << "Status sweep failed: " << e.what() << std::endl;
        exitCode = 1;
    }

    directory.disconnect();
    return exitCode;
}
