#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "Types.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

// ============== Logger ==============

class Logger {
private:
    mutable std::mutex mutex_;
    std::ostream& out_;
    std::atomic<bool> enabled_;

public:
    explicit Logger(std::ostream& out = std::cout, bool enabled = true);

    void log(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    void logRequest(const GateRequest& request);
    void logPlacement(int gateId, VehicleClass cls, int levelId, int spotId);
    void logRejection(int gateId, VehicleClass cls);
    void logRelease(int gateId, int levelId, int spotId, bool released);
    void logObserverFailure(const SpotSnapshot& spot, const std::string& what);

    void enable();
    void disable();
    bool isEnabled() const;

private:
    std::string getTimestamp() const;
};

#endif // LOGGER_HPP
