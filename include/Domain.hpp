#ifndef DOMAIN_HPP
#define DOMAIN_HPP

#include "Types.hpp"
#include "Logger.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// ============== Vehicle ==============

class Vehicle {
private:
    VehicleClass class_;
    std::string plate_;

public:
    explicit Vehicle(VehicleClass cls, std::string plate = "");

    VehicleClass getClass() const;
    const std::string& getPlate() const;
};

// ============== Spot ==============
// Smallest unit of shared state. Occupancy and accepted class are only
// touched while mutex_ is held.

class Spot {
private:
    int levelId_;
    int id_;
    VehicleClass acceptedClass_;
    bool occupied_ = false;

    mutable std::mutex mutex_;

public:
    Spot(int levelId, int id, VehicleClass acceptedClass);

    Spot(const Spot&) = delete;
    Spot& operator=(const Spot&) = delete;

    // Getters (thread-safe)
    int getId() const;
    int getLevelId() const;
    VehicleClass getAcceptedClass() const;
    bool isOccupied() const;
    SpotSnapshot snapshot() const;

    // True if free and matching. Not a reservation: the answer may be
    // stale by the time the caller acts on it.
    bool canPark(VehicleClass cls) const;

    // Occupy only if free and matching, in one lock acquisition.
    // Returns true if this call performed the claim.
    bool tryClaim(VehicleClass cls);

    // Unconditional set; callers must not park an occupied spot
    void park();

    // Unconditional clear. Returns true if the spot was occupied.
    bool leave();
};

// ============== Level ==============
// No lock of its own; every spot guards itself.

class Level {
private:
    int id_;
    std::vector<std::unique_ptr<Spot>> spots_;

public:
    explicit Level(const LevelLayout& layout);

    int getId() const;
    int getNumSpots() const;

    // Spot access by id (1-based)
    Spot& getSpot(int spotId);
    const Spot& getSpot(int spotId) const;
    bool hasSpot(int spotId) const;
    bool owns(const Spot& spot) const;

    // First spot, in index order, that this call managed to claim
    Spot* findAvailableSpot(VehicleClass cls);

    // Naive first-fit: returns the first spot that looked free without
    // claiming it. Only for ClaimPolicy::CheckThenPark.
    Spot* findCandidateSpot(VehicleClass cls) const;

    void parkVehicle(Spot& spot);
    bool releaseVehicle(Spot& spot);

    int countAvailable(VehicleClass cls) const;
    LevelStatus getStatus() const;
};

// ============== Observer Interface ==============

class IStatusObserver {
public:
    virtual ~IStatusObserver() = default;

    // Called synchronously on the thread that changed the spot
    virtual void update(const SpotSnapshot& spot) = 0;
};

// ============== Lot ==============

struct Placement {
    Level* level = nullptr;
    Spot* spot = nullptr;
};

class Lot {
private:
    std::vector<std::unique_ptr<Level>> levels_;
    ClaimPolicy claimPolicy_;

    // Registry lock is never held while observers run
    std::vector<IStatusObserver*> observers_;
    mutable std::mutex observersMutex_;
    std::atomic<int> observerFailures_{0};

    Logger* logger_ = nullptr;  // Not owned; null means silent

public:
    explicit Lot(const LotLayout& layout, ClaimPolicy policy = ClaimPolicy::Atomic);

    Lot(const Lot&) = delete;
    Lot& operator=(const Lot&) = delete;

    void setLogger(Logger* logger);

    // Accessors
    int getNumLevels() const;
    ClaimPolicy getClaimPolicy() const;
    Level& getLevel(int levelId);
    const Level& getLevel(int levelId) const;
    bool isValidLevel(int levelId) const;

    // First-fit across levels in layout order. Observers see the claimed
    // spot on success; nothing is notified on failure.
    std::optional<Placement> findAndParkVehicle(VehicleClass cls);

    // Returns false (and changes nothing) if the spot is not on this level
    // or was already free.
    bool releaseVehicle(Level& level, Spot& spot);

    // Observer registry
    void registerObserver(IStatusObserver& observer);
    void removeObserver(IStatusObserver& observer);
    int getObserverCount() const;
    int getObserverFailureCount() const;
    void notifyObservers(const Spot& spot);

    // Status
    ParkingStatus getParkingStatus() const;
    int countAvailable(VehicleClass cls) const;

private:
    Spot* claimOnLevel(Level& level, VehicleClass cls);
    Level* findLevel(int levelId) const;

    // Fan-out of an already-taken snapshot
    void publish(const SpotSnapshot& snapshot);
};

#endif // DOMAIN_HPP
