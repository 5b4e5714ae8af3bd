#ifndef GATE_HPP
#define GATE_HPP

#include "Domain.hpp"
#include "Logger.hpp"
#include <optional>

// ============== Gate ==============
// One physical entry/exit point. Holds nothing but the lot it feeds,
// so any number of gates can call in concurrently.

class Gate {
private:
    int id_;
    Lot& lot_;
    Logger* logger_;

public:
    Gate(int id, Lot& lot, Logger* logger = nullptr);

    int getId() const;

    // std::nullopt means no compatible spot was free. No retry, no queueing.
    std::optional<Placement> enter(const Vehicle& vehicle);

    // Releasing a free spot is a harmless no-op and returns false
    bool exit(Level& level, Spot& spot);
};

#endif // GATE_HPP
