#include "Gate.hpp"

Gate::Gate(int id, Lot& lot, Logger* logger)
    : id_(id), lot_(lot), logger_(logger) {}

int Gate::getId() const { return id_; }

std::optional<Placement> Gate::enter(const Vehicle& vehicle) {
    auto placement = lot_.findAndParkVehicle(vehicle.getClass());

    if (logger_) {
        if (placement) {
            logger_->logPlacement(id_, vehicle.getClass(),
                                  placement->level->getId(), placement->spot->getId());
        } else {
            logger_->logRejection(id_, vehicle.getClass());
        }
    }

    return placement;
}

bool Gate::exit(Level& level, Spot& spot) {
    bool released = lot_.releaseVehicle(level, spot);

    if (logger_) {
        logger_->logRelease(id_, level.getId(), spot.getId(), released);
    }

    return released;
}
