#include "SchedulerConfig.h"
#include "../Errors.h"
#include <cstdlib>

SchedulerConfig loadConfigFromEnv() {
    SchedulerConfig config;

    if (const char* dbUrl = std::getenv("DATABASE_URL")) {
        config.database_url = dbUrl;
    }
    if (const char* timeout = std::getenv("STATUS_TIMEOUT_DAYS")) {
        config.status_timeout_days = parseNonNegativeInt("STATUS_TIMEOUT_DAYS", timeout);
    }
    if (const char* interval = std::getenv("SWEEP_INTERVAL_SECONDS")) {
        config.sweep_interval_seconds = parseNonNegativeInt("SWEEP_INTERVAL_SECONDS", interval);
    }
    if (const char* createSchema = std::getenv("CREATE_SCHEMA")) {
        config.create_schema = parseFlag("CREATE_SCHEMA", createSchema);
    }

    return config;
}

int parseNonNegativeInt(const std::string& name, const std::string& value) {
    size_t parsed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &parsed);
    } catch (const std::exception&) {
        throw ValidationError(name + " is not an integer: '" + value + "'");
    }
    if (parsed != value.size()) {
        throw ValidationError(name + " is not an integer: '" + value + "'");
    }
    if (result < 0) {
        throw ValidationError(name + " must not be negative: " + value);
    }
    return result;
}

bool parseFlag(const std::string& name, const std::string& value) {
    if (value == "1" || value == "true" || value == "TRUE" || value == "yes") {
        return true;
    }
    if (value.empty() || value == "0" || value == "false" || value == "FALSE" || value == "no") {
        return false;
    }
    throw ValidationError(name + " is not a boolean flag: '" + value + "'");
}
