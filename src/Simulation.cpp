#include "Simulation.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

// ============== Status Board Implementation ==============

StatusBoard::StatusBoard(std::string name, Logger& logger)
    : name_(std::move(name)), logger_(logger) {}

void StatusBoard::update(const SpotSnapshot& spot) {
    ++updates_;
    logger_.log(name_ + " - Level " + std::to_string(spot.levelId) +
                " Spot " + std::to_string(spot.spotId) + ": " +
                spotStateToString(spot.state));
}

const std::string& StatusBoard::getName() const { return name_; }
int StatusBoard::getUpdateCount() const { return updates_.load(); }

std::string formatStatus(const ParkingStatus& status) {
    std::ostringstream oss;
    for (const auto& level : status.levels) {
        oss << "Level " << level.levelId << ":\n";
        for (const auto& spot : level.spots) {
            oss << "  Spot " << spot.spotId
                << " [" << vehicleClassToString(spot.acceptedClass) << "]: "
                << spotStateToString(spot.state) << "\n";
        }
    }
    oss << "Occupied: " << status.occupiedSpots() << "/" << status.totalSpots() << "\n";
    return oss.str();
}

// ============== Simulation Engine Implementation ==============

ParkingSimulation::ParkingSimulation(const Config& config, std::ostream& logOut)
    : config_(config),
      logger_(logOut, config.logEnabled),
      lot_(config.layout, config.claimPolicy),
      board_("Status Board", logger_) {

    if (config.numGates < 1) {
        throw std::invalid_argument("At least one gate is required, got " +
                                    std::to_string(config.numGates));
    }

    lot_.setLogger(&logger_);
    lot_.registerObserver(board_);

    gates_.reserve(config.numGates);
    for (int i = 0; i < config.numGates; ++i) {
        gates_.push_back(std::make_unique<Gate>(i + 1, lot_, &logger_));
    }

    logger_.log("Parking lot initialized with " +
                std::to_string(lot_.getNumLevels()) + " levels, " +
                std::to_string(lot_.getParkingStatus().totalSpots()) + " spots, " +
                std::to_string(config.numGates) + " gates");
    logger_.log("Claim policy: " + claimPolicyToString(config.claimPolicy));
}

ParkingSimulation::~ParkingSimulation() {
    stop();
}

void ParkingSimulation::start() {
    if (running_.load()) return;

    if (requests_.isClosed()) {
        logger_.error("Simulation cannot be restarted after stop()");
        return;
    }

    running_.store(true);
    logger_.log("Gates opening...");

    for (int i = 0; i < getNumGates(); ++i) {
        threads_.emplace_back(&ParkingSimulation::runGateLoop, this, i);
    }
}

void ParkingSimulation::stop() {
    if (!running_.load()) return;

    logger_.log("Gates closing...");

    // Workers drain what is queued, then see the closed queue and return
    requests_.close();

    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
    running_.store(false);

    logger_.log("Gates closed.");
}

bool ParkingSimulation::isRunning() const {
    return running_.load();
}

bool ParkingSimulation::requestEntry(VehicleClass cls) {
    GateRequest request;
    request.type = RequestType::Enter;
    request.vehicleClass = cls;

    if (!requests_.push(request)) {
        logger_.warn("Gates are closed, entry refused");
        return false;
    }
    return true;
}

bool ParkingSimulation::requestExit(int levelId, int spotId) {
    if (!lot_.isValidLevel(levelId)) {
        logger_.error("Invalid level: " + std::to_string(levelId));
        return false;
    }
    if (!lot_.getLevel(levelId).hasSpot(spotId)) {
        logger_.error("Invalid spot: " + std::to_string(spotId) +
                      " on level " + std::to_string(levelId));
        return false;
    }

    GateRequest request;
    request.type = RequestType::Exit;
    request.levelId = levelId;
    request.spotId = spotId;

    if (!requests_.push(request)) {
        logger_.warn("Gates are closed, exit refused");
        return false;
    }
    return true;
}

int ParkingSimulation::requestBurst(int count, VehicleClass cls) {
    int queued = 0;
    for (int i = 0; i < count; ++i) {
        if (requestEntry(cls)) {
            ++queued;
        }
    }
    return queued;
}

void ParkingSimulation::waitIdle() {
    if (!running_.load()) return;
    requests_.waitIdle();
}

void ParkingSimulation::printStatus(std::ostream& out) const {
    SimulationStats stats = getStats();

    out << "\n========== Parking Status ==========\n"
        << formatStatus(lot_.getParkingStatus())
        << "Admitted: " << stats.admitted
        << ", Rejected: " << stats.rejected
        << ", Released: " << stats.released << "\n"
        << "====================================\n\n";
}

SimulationStats ParkingSimulation::getStats() const {
    SimulationStats stats;
    stats.admitted = admitted_.load();
    stats.rejected = rejected_.load();
    stats.released = released_.load();
    stats.ignoredExits = ignoredExits_.load();
    return stats;
}

int ParkingSimulation::getNumGates() const {
    return static_cast<int>(gates_.size());
}

const Lot& ParkingSimulation::getLot() const {
    return lot_;
}

Lot& ParkingSimulation::getLotMutable() {
    return lot_;
}

Gate& ParkingSimulation::getGate(int index) {
    if (index < 0 || index >= getNumGates()) {
        throw std::out_of_range("Invalid gate index: " + std::to_string(index));
    }
    return *gates_[index];
}

Logger& ParkingSimulation::getLogger() {
    return logger_;
}

const StatusBoard& ParkingSimulation::getStatusBoard() const {
    return board_;
}

void ParkingSimulation::runGateLoop(int gateIndex) {
    Gate& gate = *gates_[gateIndex];

    while (auto request = requests_.pop()) {
        logger_.logRequest(*request);
        processRequest(gate, *request);
        requests_.markDone();
    }
}

void ParkingSimulation::processRequest(Gate& gate, const GateRequest& request) {
    try {
        switch (request.type) {
            case RequestType::Enter: {
                if (gate.enter(Vehicle(request.vehicleClass))) {
                    ++admitted_;
                } else {
                    ++rejected_;
                }
                break;
            }
            case RequestType::Exit: {
                Level& level = lot_.getLevel(request.levelId);
                Spot& spot = level.getSpot(request.spotId);
                if (gate.exit(level, spot)) {
                    ++released_;
                } else {
                    ++ignoredExits_;
                }
                break;
            }
        }
    } catch (const std::exception& e) {
        logger_.error("Gate " + std::to_string(gate.getId()) + ": " + e.what());
    }
}

// ============== CLI Implementation ==============

CLI::CLI(ParkingSimulation& engine, std::istream& in, std::ostream& out)
    : engine_(engine), in_(in), out_(out) {}

void CLI::run() {
    printHelp();

    std::string line;
    while (running_.load() && std::getline(in_, line)) {
        if (line.empty()) continue;
        processCommand(line);
    }
}

void CLI::stop() {
    running_.store(false);
}

void CLI::printHelp() {
    out_ << "\n=== Parking Lot CLI ===\n"
         << "Commands:\n"
         << "  enter <class>          - Vehicle arrives (car|motorcycle|truck)\n"
         << "  exit <level> <spot>    - Vehicle leaves (e.g., 'exit 1 3')\n"
         << "  burst <count> <class>  - Many vehicles arrive at once\n"
         << "  wait                   - Wait for queued requests to finish\n"
         << "  status                 - Print current status\n"
         << "  help                   - Show this help\n"
         << "  quit                   - Exit\n"
         << "\n";
}

void CLI::processCommand(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::string args;
    std::getline(iss, args);

    try {
        if (cmd == "enter") {
            if (!parseEnter(args)) {
                out_ << "Usage: enter <car|motorcycle|truck>\n";
            }
        }
        else if (cmd == "exit") {
            if (!parseExit(args)) {
                out_ << "Usage: exit <level_id> <spot_id>\n";
            }
        }
        else if (cmd == "burst") {
            if (!parseBurst(args)) {
                out_ << "Usage: burst <count> <car|motorcycle|truck>\n";
            }
        }
        else if (cmd == "wait") {
            engine_.waitIdle();
        }
        else if (cmd == "status") {
            engine_.waitIdle();
            engine_.printStatus(out_);
        }
        else if (cmd == "help") {
            printHelp();
        }
        else if (cmd == "quit" || cmd == "q") {
            engine_.stop();
            running_.store(false);
        }
        else {
            out_ << "Unknown command: " << cmd << ". Type 'help' for usage.\n";
        }
    } catch (const std::exception& e) {
        out_ << "Error: " << e.what() << "\n";
    }
}

bool CLI::parseEnter(const std::string& args) {
    std::istringstream iss(args);
    std::string name;

    if (!(iss >> name)) {
        return false;
    }

    engine_.requestEntry(parseVehicleClass(name));
    return true;
}

bool CLI::parseExit(const std::string& args) {
    std::istringstream iss(args);
    int levelId, spotId;

    if (!(iss >> levelId >> spotId)) {
        return false;
    }

    engine_.requestExit(levelId, spotId);
    return true;
}

bool CLI::parseBurst(const std::string& args) {
    std::istringstream iss(args);
    int count;
    std::string name;

    if (!(iss >> count >> name) || count < 1) {
        return false;
    }

    int queued = engine_.requestBurst(count, parseVehicleClass(name));
    out_ << "Queued " << queued << " arrivals\n";
    return true;
}
