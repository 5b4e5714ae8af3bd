#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <string>
#include <vector>

// ============== Enums =============

enum class VehicleClass {
    Compact,        // Cars
    TwoWheeler,     // Motorcycles
    Oversized       // Trucks
};

enum class SpotState {
    Free,
    Occupied
};

// How a Lot turns "this spot looks free" into "this spot is mine"
enum class ClaimPolicy {
    Atomic,         // Check and occupy under one lock acquisition
    CheckThenPark   // Naive: separate check and park, racy under contention
};

enum class RequestType {
    Enter,
    Exit
};

// ============== Layout / Configuration ==============

struct LevelLayout {
    int levelId = 1;
    std::vector<VehicleClass> spots;  // Spot i gets id i + 1
};

struct LotLayout {
    std::vector<LevelLayout> levels;
};

// One level: Car, Motorcycle, Car, Truck
LotLayout defaultLayout();

// "CMCT;CCM" -> two levels. C = Compact, M = TwoWheeler, T/O = Oversized.
// Throws std::invalid_argument on anything else.
LotLayout parseLayout(const std::string& text);

struct Config {
    LotLayout layout = defaultLayout();
    int numGates = 2;
    ClaimPolicy claimPolicy = ClaimPolicy::Atomic;
    bool logEnabled = true;
};

// ============== Snapshots ==============

struct SpotSnapshot {
    int levelId = -1;
    int spotId = -1;
    VehicleClass acceptedClass = VehicleClass::Compact;
    SpotState state = SpotState::Free;

    bool isOccupied() const { return state == SpotState::Occupied; }
};

struct LevelStatus {
    int levelId = -1;
    std::vector<SpotSnapshot> spots;
};

// Point-in-time view of the whole lot. Each spot is read consistently,
// but spots may come from slightly different instants.
struct ParkingStatus {
    std::vector<LevelStatus> levels;

    int totalSpots() const;
    int occupiedSpots() const;
    int freeSpots(VehicleClass cls) const;
};

// ============== Gate Request ==============

struct GateRequest {
    RequestType type = RequestType::Enter;
    VehicleClass vehicleClass = VehicleClass::Compact;
    int levelId = -1;
    int spotId = -1;
    std::chrono::steady_clock::time_point timestamp =
        std::chrono::steady_clock::now();
};

// ============== Utility Functions ==============

inline std::string vehicleClassToString(VehicleClass cls) {
    switch (cls) {
        case VehicleClass::Compact: return "Compact";
        case VehicleClass::TwoWheeler: return "TwoWheeler";
        case VehicleClass::Oversized: return "Oversized";
    }
    return "Unknown";
}

inline std::string spotStateToString(SpotState state) {
    switch (state) {
        case SpotState::Free: return "Available";
        case SpotState::Occupied: return "Occupied";
    }
    return "Unknown";
}

inline std::string claimPolicyToString(ClaimPolicy policy) {
    switch (policy) {
        case ClaimPolicy::Atomic: return "Atomic";
        case ClaimPolicy::CheckThenPark: return "CheckThenPark (naive)";
    }
    return "Unknown";
}

// Accepts class names and the everyday names (car, motorcycle, bike, truck),
// case-insensitive. Throws std::invalid_argument otherwise.
VehicleClass parseVehicleClass(const std::string& name);

#endif // TYPES_HPP
