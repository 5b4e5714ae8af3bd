#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

Logger::Logger(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled) {}

void Logger::log(const std::string& message) {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << getTimestamp() << " " << message << "\n";
}

void Logger::warn(const std::string& message) {
    log("[WARN] " + message);
}

void Logger::error(const std::string& message) {
    log("[ERROR] " + message);
}

void Logger::logRequest(const GateRequest& request) {
    if (!enabled_) return;

    std::ostringstream oss;
    oss << "[REQUEST] ";

    switch (request.type) {
        case RequestType::Enter:
            oss << "Enter class=" << vehicleClassToString(request.vehicleClass);
            break;
        case RequestType::Exit:
            oss << "Exit level=" << request.levelId
                << " spot=" << request.spotId;
            break;
    }

    log(oss.str());
}

void Logger::logPlacement(int gateId, VehicleClass cls, int levelId, int spotId) {
    log("[ENTER] gate=" + std::to_string(gateId) +
        " " + vehicleClassToString(cls) +
        " parked at Level " + std::to_string(levelId) +
        ", Spot " + std::to_string(spotId));
}

void Logger::logRejection(int gateId, VehicleClass cls) {
    log("[REJECT] gate=" + std::to_string(gateId) +
        " no available spot for " + vehicleClassToString(cls));
}

void Logger::logRelease(int gateId, int levelId, int spotId, bool released) {
    log("[EXIT] gate=" + std::to_string(gateId) +
        " Level " + std::to_string(levelId) +
        ", Spot " + std::to_string(spotId) +
        (released ? " released" : " was already free"));
}

void Logger::logObserverFailure(const SpotSnapshot& spot, const std::string& what) {
    log("[OBSERVER] update failed for Level " + std::to_string(spot.levelId) +
        ", Spot " + std::to_string(spot.spotId) + ": " + what);
}

void Logger::enable() { enabled_.store(true); }
void Logger::disable() { enabled_.store(false); }
bool Logger::isEnabled() const { return enabled_.load(); }

std::string Logger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << "[" << std::put_time(&local, "%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << millis << "]";
    return oss.str();
}
