#include "Domain.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

// ============== Vehicle Implementation ==============

Vehicle::Vehicle(VehicleClass cls, std::string plate)
    : class_(cls), plate_(std::move(plate)) {}

VehicleClass Vehicle::getClass() const { return class_; }
const std::string& Vehicle::getPlate() const { return plate_; }

// ============== Spot Implementation ==============

Spot::Spot(int levelId, int id, VehicleClass acceptedClass)
    : levelId_(levelId), id_(id), acceptedClass_(acceptedClass) {}

int Spot::getId() const {
    return id_;  // Immutable, no lock needed
}

int Spot::getLevelId() const {
    return levelId_;  // Immutable, no lock needed
}

VehicleClass Spot::getAcceptedClass() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acceptedClass_;
}

bool Spot::isOccupied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return occupied_;
}

SpotSnapshot Spot::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SpotSnapshot snap;
    snap.levelId = levelId_;
    snap.spotId = id_;
    snap.acceptedClass = acceptedClass_;
    snap.state = occupied_ ? SpotState::Occupied : SpotState::Free;
    return snap;
}

bool Spot::canPark(VehicleClass cls) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !occupied_ && acceptedClass_ == cls;
}

bool Spot::tryClaim(VehicleClass cls) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (occupied_ || acceptedClass_ != cls) {
        return false;
    }
    occupied_ = true;
    return true;
}

void Spot::park() {
    std::lock_guard<std::mutex> lock(mutex_);
    occupied_ = true;
}

bool Spot::leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool wasOccupied = occupied_;
    occupied_ = false;
    return wasOccupied;
}

// ============== Level Implementation ==============

Level::Level(const LevelLayout& layout) : id_(layout.levelId) {
    spots_.reserve(layout.spots.size());
    for (size_t i = 0; i < layout.spots.size(); ++i) {
        spots_.push_back(
            std::make_unique<Spot>(id_, static_cast<int>(i) + 1, layout.spots[i])
        );
    }
}

int Level::getId() const { return id_; }
int Level::getNumSpots() const { return static_cast<int>(spots_.size()); }

Spot& Level::getSpot(int spotId) {
    if (!hasSpot(spotId)) {
        throw std::out_of_range("Invalid spot ID " + std::to_string(spotId) +
                                " on level " + std::to_string(id_));
    }
    return *spots_[spotId - 1];  // Convert 1-indexed to 0-indexed
}

const Spot& Level::getSpot(int spotId) const {
    if (!hasSpot(spotId)) {
        throw std::out_of_range("Invalid spot ID " + std::to_string(spotId) +
                                " on level " + std::to_string(id_));
    }
    return *spots_[spotId - 1];
}

bool Level::hasSpot(int spotId) const {
    return spotId >= 1 && spotId <= getNumSpots();
}

bool Level::owns(const Spot& spot) const {
    return std::any_of(spots_.begin(), spots_.end(),
                       [&spot](const std::unique_ptr<Spot>& s) { return s.get() == &spot; });
}

Spot* Level::findAvailableSpot(VehicleClass cls) {
    for (auto& spot : spots_) {
        if (spot->tryClaim(cls)) {
            return spot.get();
        }
    }
    return nullptr;
}

Spot* Level::findCandidateSpot(VehicleClass cls) const {
    for (const auto& spot : spots_) {
        if (spot->canPark(cls)) {
            return spot.get();
        }
    }
    return nullptr;
}

void Level::parkVehicle(Spot& spot) {
    spot.park();
}

bool Level::releaseVehicle(Spot& spot) {
    return spot.leave();
}

int Level::countAvailable(VehicleClass cls) const {
    return static_cast<int>(std::count_if(
        spots_.begin(), spots_.end(),
        [cls](const std::unique_ptr<Spot>& s) { return s->canPark(cls); }));
}

LevelStatus Level::getStatus() const {
    LevelStatus status;
    status.levelId = id_;
    status.spots.reserve(spots_.size());
    for (const auto& spot : spots_) {
        status.spots.push_back(spot->snapshot());
    }
    return status;
}

// ============== Lot Implementation ==============

Lot::Lot(const LotLayout& layout, ClaimPolicy policy) : claimPolicy_(policy) {
    levels_.reserve(layout.levels.size());
    for (const auto& levelLayout : layout.levels) {
        if (findLevel(levelLayout.levelId) != nullptr) {
            throw std::invalid_argument("Duplicate level ID: " +
                                        std::to_string(levelLayout.levelId));
        }
        levels_.push_back(std::make_unique<Level>(levelLayout));
    }
}

void Lot::setLogger(Logger* logger) {
    logger_ = logger;
}

int Lot::getNumLevels() const { return static_cast<int>(levels_.size()); }
ClaimPolicy Lot::getClaimPolicy() const { return claimPolicy_; }

Level& Lot::getLevel(int levelId) {
    Level* level = findLevel(levelId);
    if (level == nullptr) {
        throw std::out_of_range("Invalid level ID: " + std::to_string(levelId));
    }
    return *level;
}

const Level& Lot::getLevel(int levelId) const {
    const Level* level = findLevel(levelId);
    if (level == nullptr) {
        throw std::out_of_range("Invalid level ID: " + std::to_string(levelId));
    }
    return *level;
}

bool Lot::isValidLevel(int levelId) const {
    return findLevel(levelId) != nullptr;
}

std::optional<Placement> Lot::findAndParkVehicle(VehicleClass cls) {
    for (auto& level : levels_) {
        Spot* spot = claimOnLevel(*level, cls);
        if (spot != nullptr) {
            // Spot state is settled before anyone is told about it
            notifyObservers(*spot);
            return Placement{level.get(), spot};
        }
    }
    return std::nullopt;
}

bool Lot::releaseVehicle(Level& level, Spot& spot) {
    if (!level.owns(spot)) {
        if (logger_) {
            logger_->warn("Spot " + std::to_string(spot.getId()) +
                          " of level " + std::to_string(spot.getLevelId()) +
                          " is not on level " + std::to_string(level.getId()) +
                          ", release ignored");
        }
        return false;
    }

    if (!level.releaseVehicle(spot)) {
        return false;  // Already free
    }

    SpotSnapshot snap;
    snap.levelId = level.getId();
    snap.spotId = spot.getId();
    snap.acceptedClass = spot.getAcceptedClass();
    snap.state = SpotState::Free;
    publish(snap);
    return true;
}

void Lot::registerObserver(IStatusObserver& observer) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    if (std::find(observers_.begin(), observers_.end(), &observer) == observers_.end()) {
        observers_.push_back(&observer);
    }
}

void Lot::removeObserver(IStatusObserver& observer) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    auto it = std::find(observers_.begin(), observers_.end(), &observer);
    if (it != observers_.end()) {
        observers_.erase(it);
    }
}

int Lot::getObserverCount() const {
    std::lock_guard<std::mutex> lock(observersMutex_);
    return static_cast<int>(observers_.size());
}

int Lot::getObserverFailureCount() const {
    return observerFailures_.load();
}

void Lot::notifyObservers(const Spot& spot) {
    publish(spot.snapshot());
}

ParkingStatus Lot::getParkingStatus() const {
    ParkingStatus status;
    status.levels.reserve(levels_.size());
    for (const auto& level : levels_) {
        status.levels.push_back(level->getStatus());
    }
    return status;
}

int Lot::countAvailable(VehicleClass cls) const {
    int total = 0;
    for (const auto& level : levels_) {
        total += level->countAvailable(cls);
    }
    return total;
}

Spot* Lot::claimOnLevel(Level& level, VehicleClass cls) {
    if (claimPolicy_ == ClaimPolicy::Atomic) {
        return level.findAvailableSpot(cls);
    }

    // Naive path: another caller may pick the same candidate before park()
    Spot* candidate = level.findCandidateSpot(cls);
    if (candidate != nullptr) {
        level.parkVehicle(*candidate);
    }
    return candidate;
}

Level* Lot::findLevel(int levelId) const {
    for (const auto& level : levels_) {
        if (level->getId() == levelId) {
            return level.get();
        }
    }
    return nullptr;
}

void Lot::publish(const SpotSnapshot& snapshot) {
    std::vector<IStatusObserver*> observers;
    {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers = observers_;
    }

    for (IStatusObserver* observer : observers) {
        try {
            observer->update(snapshot);
        } catch (const std::exception& e) {
            ++observerFailures_;
            if (logger_) logger_->logObserverFailure(snapshot, e.what());
        } catch (...) {
            ++observerFailures_;
            if (logger_) logger_->logObserverFailure(snapshot, "unknown exception");
        }
    }
}
