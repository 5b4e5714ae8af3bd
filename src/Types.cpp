#include "Types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

// ============== Layout ==============

LotLayout defaultLayout() {
    LevelLayout level;
    level.levelId = 1;
    level.spots = {
        VehicleClass::Compact,
        VehicleClass::TwoWheeler,
        VehicleClass::Compact,
        VehicleClass::Oversized
    };

    LotLayout layout;
    layout.levels.push_back(level);
    return layout;
}

LotLayout parseLayout(const std::string& text) {
    LotLayout layout;
    LevelLayout current;
    current.levelId = 1;

    auto finishLevel = [&]() {
        if (current.spots.empty()) {
            throw std::invalid_argument(
                "Layout level " + std::to_string(current.levelId) + " has no spots");
        }
        layout.levels.push_back(current);
        current.spots.clear();
        ++current.levelId;
    };

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;

        switch (std::toupper(static_cast<unsigned char>(c))) {
            case 'C': current.spots.push_back(VehicleClass::Compact); break;
            case 'M': current.spots.push_back(VehicleClass::TwoWheeler); break;
            case 'T':
            case 'O': current.spots.push_back(VehicleClass::Oversized); break;
            case ';': finishLevel(); break;
            default:
                throw std::invalid_argument(
                    std::string("Invalid spot code '") + c + "' in layout");
        }
    }

    // Trailing ';' is allowed
    if (!current.spots.empty() || layout.levels.empty()) {
        finishLevel();
    }

    return layout;
}

// ============== ParkingStatus ==============

int ParkingStatus::totalSpots() const {
    int total = 0;
    for (const auto& level : levels) {
        total += static_cast<int>(level.spots.size());
    }
    return total;
}

int ParkingStatus::occupiedSpots() const {
    int occupied = 0;
    for (const auto& level : levels) {
        occupied += static_cast<int>(std::count_if(
            level.spots.begin(), level.spots.end(),
            [](const SpotSnapshot& s) { return s.isOccupied(); }));
    }
    return occupied;
}

int ParkingStatus::freeSpots(VehicleClass cls) const {
    int available = 0;
    for (const auto& level : levels) {
        for (const auto& spot : level.spots) {
            if (!spot.isOccupied() && spot.acceptedClass == cls) {
                ++available;
            }
        }
    }
    return available;
}

// ============== Parsing ==============

VehicleClass parseVehicleClass(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "compact" || lower == "car" || lower == "c") {
        return VehicleClass::Compact;
    }
    if (lower == "twowheeler" || lower == "motorcycle" || lower == "bike" || lower == "m") {
        return VehicleClass::TwoWheeler;
    }
    if (lower == "oversized" || lower == "truck" || lower == "t" || lower == "o") {
        return VehicleClass::Oversized;
    }
    throw std::invalid_argument("Unknown vehicle class: " + name);
}
