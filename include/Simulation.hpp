#ifndef SIMULATION_HPP
#define SIMULATION_HPP

#include "Types.hpp"
#include "Domain.hpp"
#include "Gate.hpp"
#include "Logger.hpp"
#include "WorkQueue.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// ============== Status Board ==============
// Display observer: logs every transition it is told about.

class StatusBoard : public IStatusObserver {
private:
    std::string name_;
    Logger& logger_;
    std::atomic<int> updates_{0};

public:
    StatusBoard(std::string name, Logger& logger);

    void update(const SpotSnapshot& spot) override;

    const std::string& getName() const;
    int getUpdateCount() const;
};

// Renders a status snapshot, one line per spot
std::string formatStatus(const ParkingStatus& status);

// ============== Simulation Engine ==============

struct SimulationStats {
    int admitted = 0;
    int rejected = 0;
    int released = 0;
    int ignoredExits = 0;
};

class ParkingSimulation {
private:
    Config config_;
    Logger logger_;
    Lot lot_;
    StatusBoard board_;
    std::vector<std::unique_ptr<Gate>> gates_;
    WorkQueue<GateRequest> requests_;

    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};

    std::atomic<int> admitted_{0};
    std::atomic<int> rejected_{0};
    std::atomic<int> released_{0};
    std::atomic<int> ignoredExits_{0};

public:
    explicit ParkingSimulation(const Config& config, std::ostream& logOut = std::cout);
    ~ParkingSimulation();

    // Non-copyable
    ParkingSimulation(const ParkingSimulation&) = delete;
    ParkingSimulation& operator=(const ParkingSimulation&) = delete;

    // Lifecycle. Requests queued before start() wait for the gate workers;
    // stop() processes whatever is still queued, then joins.
    void start();
    void stop();
    bool isRunning() const;

    // Commands (from CLI or external). Return false if the request was refused.
    bool requestEntry(VehicleClass cls);
    bool requestExit(int levelId, int spotId);
    int requestBurst(int count, VehicleClass cls);

    // Blocks until every queued request has been handled. No-op when stopped.
    void waitIdle();

    // Status
    void printStatus(std::ostream& out = std::cout) const;
    SimulationStats getStats() const;
    int getNumGates() const;

    // Access for testing
    const Lot& getLot() const;
    Lot& getLotMutable();
    Gate& getGate(int index);
    Logger& getLogger();
    const StatusBoard& getStatusBoard() const;

private:
    void runGateLoop(int gateIndex);
    void processRequest(Gate& gate, const GateRequest& request);
};

// ============== CLI Helper ==============

class CLI {
private:
    ParkingSimulation& engine_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{true};

public:
    explicit CLI(ParkingSimulation& engine,
                 std::istream& in = std::cin,
                 std::ostream& out = std::cout);

    void run();
    void stop();

private:
    void printHelp();
    void processCommand(const std::string& line);
    bool parseEnter(const std::string& args);
    bool parseExit(const std::string& args);
    bool parseBurst(const std::string& args);
};

#endif // SIMULATION_HPP
