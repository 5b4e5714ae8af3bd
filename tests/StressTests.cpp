#include <gtest/gtest.h>
#include "Domain.hpp"
#include "Gate.hpp"
#include "Simulation.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <thread>
#include <utility>
#include <vector>

namespace {

// Releases all waiting threads at once so they hit the lot together
class StartLine {
private:
    std::atomic<bool> go_{false};

public:
    void wait() const {
        while (!go_.load()) {
            std::this_thread::yield();
        }
    }

    void release() { go_.store(true); }
};

class CountingObserver : public IStatusObserver {
public:
    void update(const SpotSnapshot&) override { ++count; }

    std::atomic<int> count{0};
};

// Observer that calls back into the lot while being notified
class ReentrantObserver : public IStatusObserver {
public:
    explicit ReentrantObserver(Lot& lot) : lot_(lot) {}

    void update(const SpotSnapshot&) override {
        lot_.getObserverCount();
        lot_.getParkingStatus();
        ++count;
    }

    std::atomic<int> count{0};

private:
    Lot& lot_;
};

LotLayout randomLayout(std::mt19937& gen, int compactSpots) {
    std::uniform_int_distribution<> levelDist(1, 4);
    std::uniform_int_distribution<> fillerDist(0, 3);

    int numLevels = levelDist(gen);
    LotLayout layout;
    for (int i = 0; i < numLevels; ++i) {
        LevelLayout level;
        level.levelId = i + 1;
        layout.levels.push_back(level);
    }

    // Scatter the compact spots between motorcycle and truck spots
    std::uniform_int_distribution<> pick(0, numLevels - 1);
    for (int i = 0; i < compactSpots; ++i) {
        auto& spots = layout.levels[pick(gen)].spots;
        for (int f = fillerDist(gen); f > 0; --f) {
            spots.push_back(f % 2 ? VehicleClass::TwoWheeler : VehicleClass::Oversized);
        }
        spots.push_back(VehicleClass::Compact);
    }
    return layout;
}

}  // namespace

// ============== No Double Booking ==============

TEST(StressTest, NoDoubleBooking) {
    Lot lot(parseLayout("CCCCCMCCCCC;CCCCTCCCCC"));
    const int compactSpots = lot.countAvailable(VehicleClass::Compact);
    const int numThreads = 64;
    ASSERT_EQ(compactSpots, 19);

    StartLine start;
    std::mutex mutex;
    std::vector<std::pair<int, int>> claimed;
    std::atomic<int> rejected{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&lot, &start, &mutex, &claimed, &rejected, t]() {
            Gate gate(t, lot);
            start.wait();

            auto placement = gate.enter(Vehicle(VehicleClass::Compact));
            if (placement) {
                std::lock_guard<std::mutex> lock(mutex);
                claimed.emplace_back(placement->level->getId(), placement->spot->getId());
            } else {
                ++rejected;
            }
        });
    }

    start.release();
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(static_cast<int>(claimed.size()), compactSpots);
    EXPECT_EQ(rejected.load(), numThreads - compactSpots);

    std::set<std::pair<int, int>> unique(claimed.begin(), claimed.end());
    EXPECT_EQ(unique.size(), claimed.size());

    for (const auto& [levelId, spotId] : claimed) {
        EXPECT_TRUE(lot.getLevel(levelId).getSpot(spotId).isOccupied());
    }
    EXPECT_EQ(lot.countAvailable(VehicleClass::Compact), 0);
}

// ============== Randomized Contention ==============

TEST(StressTest, ExactlyKWinnersAcrossRandomRuns) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> spotDist(1, 12);
    std::uniform_int_distribution<> extraDist(1, 20);

    for (int run = 0; run < 40; ++run) {
        const int k = spotDist(gen);
        const int n = k + extraDist(gen);

        Lot lot(randomLayout(gen, k));
        ASSERT_EQ(lot.countAvailable(VehicleClass::Compact), k);

        StartLine start;
        std::atomic<int> successes{0};
        std::atomic<int> failures{0};

        std::vector<std::thread> threads;
        for (int t = 0; t < n; ++t) {
            threads.emplace_back([&lot, &start, &successes, &failures, t]() {
                Gate gate(t, lot);
                start.wait();
                if (gate.enter(Vehicle(VehicleClass::Compact))) {
                    ++successes;
                } else {
                    ++failures;
                }
            });
        }

        start.release();
        for (auto& t : threads) {
            t.join();
        }

        EXPECT_EQ(successes.load(), k) << "run " << run;
        EXPECT_EQ(failures.load(), n - k) << "run " << run;

        // Other classes were never touched
        ParkingStatus status = lot.getParkingStatus();
        EXPECT_EQ(status.occupiedSpots(), k) << "run " << run;
    }
}

TEST(StressTest, MixedClassesDoNotInterfere) {
    Lot lot(parseLayout("CMTCMT;CMTCMT;CMTCMT"));
    const int perClass = 6;
    const int perClassCallers = 15;

    StartLine start;
    std::atomic<int> wins[3] = {{0}, {0}, {0}};
    const VehicleClass classes[3] = {
        VehicleClass::Compact, VehicleClass::TwoWheeler, VehicleClass::Oversized
    };

    std::vector<std::thread> threads;
    for (int c = 0; c < 3; ++c) {
        for (int t = 0; t < perClassCallers; ++t) {
            threads.emplace_back([&lot, &start, &wins, &classes, c]() {
                Gate gate(c, lot);
                start.wait();
                auto placement = gate.enter(Vehicle(classes[c]));
                if (placement) {
                    EXPECT_EQ(placement->spot->getAcceptedClass(), classes[c]);
                    ++wins[c];
                }
            });
        }
    }

    start.release();
    for (auto& t : threads) {
        t.join();
    }

    for (int c = 0; c < 3; ++c) {
        EXPECT_EQ(wins[c].load(), perClass);
    }
    EXPECT_EQ(lot.getParkingStatus().occupiedSpots(), 18);
}

// ============== Enter / Exit Churn ==============

TEST(StressTest, ChurnKeepsSpotsExclusive) {
    Lot lot(parseLayout("CCCC;CCCC"));
    const int numThreads = 12;
    const int cyclesPerThread = 300;

    // holders[level][spot] counts vehicles that believe they hold the spot
    std::atomic<int> holders[3][5] = {};
    std::atomic<int> violations{0};
    std::atomic<int> parked{0};

    StartLine start;
    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&, t]() {
            Gate gate(t, lot);
            start.wait();

            for (int i = 0; i < cyclesPerThread; ++i) {
                auto placement = gate.enter(Vehicle(VehicleClass::Compact));
                if (!placement) {
                    std::this_thread::yield();
                    continue;
                }
                ++parked;

                auto& holder = holders[placement->level->getId()][placement->spot->getId()];
                if (holder.fetch_add(1) != 0) {
                    ++violations;
                }
                std::this_thread::yield();
                holder.fetch_sub(1);

                EXPECT_TRUE(gate.exit(*placement->level, *placement->spot));
            }
        });
    }

    start.release();
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(violations.load(), 0);
    EXPECT_GT(parked.load(), 0);

    // Nothing in flight: every spot must read Free
    ParkingStatus status = lot.getParkingStatus();
    EXPECT_EQ(status.occupiedSpots(), 0);
    EXPECT_EQ(lot.countAvailable(VehicleClass::Compact), 8);
}

TEST(StressTest, ConcurrentExitsOfSameSpot) {
    Lot lot(parseLayout("C"));
    Level& level = lot.getLevel(1);
    Spot& spot = level.getSpot(1);

    for (int round = 0; round < 50; ++round) {
        ASSERT_TRUE(lot.findAndParkVehicle(VehicleClass::Compact).has_value());

        StartLine start;
        std::atomic<int> released{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&, t]() {
                Gate gate(t, lot);
                start.wait();
                if (gate.exit(level, spot)) {
                    ++released;
                }
            });
        }

        start.release();
        for (auto& t : threads) {
            t.join();
        }

        EXPECT_EQ(released.load(), 1);
        EXPECT_FALSE(spot.isOccupied());
    }
}

// ============== Observers Under Load ==============

TEST(StressTest, ObserverRegistryChangesDuringNotification) {
    Lot lot(parseLayout("CCCCCCCC;MMMM"));
    CountingObserver steady;
    lot.registerObserver(steady);

    std::atomic<bool> done{false};
    std::atomic<int> transitions{0};

    // Keeps adding and removing observers while gates notify
    std::thread churner([&lot, &done]() {
        std::vector<std::unique_ptr<CountingObserver>> pool;
        for (int i = 0; i < 8; ++i) {
            pool.push_back(std::make_unique<CountingObserver>());
        }
        size_t i = 0;
        while (!done.load()) {
            lot.registerObserver(*pool[i % pool.size()]);
            lot.removeObserver(*pool[(i + 3) % pool.size()]);
            ++i;
        }
        for (auto& observer : pool) {
            lot.removeObserver(*observer);
        }
    });

    std::vector<std::thread> gates;
    for (int t = 0; t < 6; ++t) {
        gates.emplace_back([&lot, &transitions, t]() {
            Gate gate(t, lot);
            VehicleClass cls = (t % 2 == 0) ? VehicleClass::Compact : VehicleClass::TwoWheeler;
            for (int i = 0; i < 500; ++i) {
                if (auto placement = gate.enter(Vehicle(cls))) {
                    ++transitions;
                    if (gate.exit(*placement->level, *placement->spot)) {
                        ++transitions;
                    }
                }
            }
        });
    }

    for (auto& t : gates) {
        t.join();
    }
    done.store(true);
    churner.join();

    EXPECT_EQ(steady.count.load(), transitions.load());
    EXPECT_EQ(lot.getObserverCount(), 1);
    EXPECT_EQ(lot.getParkingStatus().occupiedSpots(), 0);
}

TEST(StressTest, ObserverMayCallBackIntoLot) {
    Lot lot(parseLayout("CCCC"));
    ReentrantObserver observer(lot);
    lot.registerObserver(observer);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&lot, t]() {
            Gate gate(t, lot);
            for (int i = 0; i < 100; ++i) {
                if (auto placement = gate.enter(Vehicle(VehicleClass::Compact))) {
                    gate.exit(*placement->level, *placement->spot);
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_GT(observer.count.load(), 0);
}

// ============== Status Snapshot ==============

TEST(StressTest, StatusReadsDuringMutation) {
    Lot lot(parseLayout("CCCCCC;CCCCCC"));
    std::atomic<bool> done{false};

    std::thread reader([&lot, &done]() {
        while (!done.load()) {
            ParkingStatus status = lot.getParkingStatus();
            EXPECT_EQ(status.totalSpots(), 12);
            EXPECT_LE(status.occupiedSpots(), 12);
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&lot, t]() {
            Gate gate(t, lot);
            std::vector<Placement> held;
            for (int i = 0; i < 200; ++i) {
                if (auto placement = gate.enter(Vehicle(VehicleClass::Compact))) {
                    held.push_back(*placement);
                }
                if (held.size() > 2) {
                    gate.exit(*held.front().level, *held.front().spot);
                    held.erase(held.begin());
                }
            }
            for (auto& p : held) {
                gate.exit(*p.level, *p.spot);
            }
        });
    }

    for (auto& t : writers) {
        t.join();
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(lot.getParkingStatus().occupiedSpots(), 0);
}

// ============== WorkQueue Thread Safety ==============

TEST(StressTest, WorkQueueConcurrency) {
    WorkQueue<int> queue;

    const int numProducers = 4;
    const int numConsumers = 3;
    const int itemsPerProducer = 250;

    std::atomic<int> consumed{0};
    std::atomic<long> sum{0};

    std::vector<std::thread> consumers;
    for (int c = 0; c < numConsumers; ++c) {
        consumers.emplace_back([&queue, &consumed, &sum]() {
            while (auto item = queue.pop()) {
                sum += *item;
                ++consumed;
                queue.markDone();
            }
        });
    }

    std::vector<std::thread> producers;
    for (int p = 0; p < numProducers; ++p) {
        producers.emplace_back([&queue, p]() {
            for (int i = 0; i < itemsPerProducer; ++i) {
                queue.push(p * itemsPerProducer + i);
            }
        });
    }

    for (auto& t : producers) {
        t.join();
    }

    queue.waitIdle();
    const int total = numProducers * itemsPerProducer;
    EXPECT_EQ(consumed.load(), total);
    EXPECT_EQ(sum.load(), static_cast<long>(total) * (total - 1) / 2);

    queue.close();
    for (auto& t : consumers) {
        t.join();
    }
}

// ============== Simulation Engine ==============

TEST(StressTest, EngineBurstMoreVehiclesThanSpots) {
    Config config;
    config.layout = parseLayout("CCCCC;CCCCC");
    config.numGates = 4;
    config.logEnabled = false;

    ParkingSimulation engine(config);
    engine.start();

    EXPECT_EQ(engine.requestBurst(50, VehicleClass::Compact), 50);
    engine.waitIdle();

    SimulationStats stats = engine.getStats();
    EXPECT_EQ(stats.admitted, 10);
    EXPECT_EQ(stats.rejected, 40);
    EXPECT_EQ(engine.getLot().getParkingStatus().occupiedSpots(), 10);

    // Everyone leaves through whichever gate picks the request up
    for (int level = 1; level <= 2; ++level) {
        for (int spot = 1; spot <= 5; ++spot) {
            engine.requestExit(level, spot);
        }
    }
    engine.waitIdle();

    EXPECT_EQ(engine.getStats().released, 10);
    EXPECT_EQ(engine.getLot().getParkingStatus().occupiedSpots(), 0);
    EXPECT_EQ(engine.getStatusBoard().getUpdateCount(), 20);

    engine.stop();
}

TEST(StressTest, ConcurrentRequestProducers) {
    Config config;
    config.layout = parseLayout("CMTCMT;CMTCMT");
    config.numGates = 3;
    config.logEnabled = false;

    ParkingSimulation engine(config);
    engine.start();

    const int numThreads = 4;
    const int requestsPerThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([&engine, requestsPerThread, t]() {
            std::mt19937 gen(1000 + t);
            std::uniform_int_distribution<> classDist(0, 2);
            std::uniform_int_distribution<> levelDist(1, 2);
            std::uniform_int_distribution<> spotDist(1, 6);

            for (int i = 0; i < requestsPerThread; ++i) {
                if (i % 2 == 0) {
                    engine.requestEntry(static_cast<VehicleClass>(classDist(gen)));
                } else {
                    engine.requestExit(levelDist(gen), spotDist(gen));
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }
    engine.waitIdle();

    SimulationStats stats = engine.getStats();
    EXPECT_EQ(stats.admitted + stats.rejected, numThreads * (requestsPerThread + 1) / 2);
    EXPECT_EQ(stats.released + stats.ignoredExits, numThreads * (requestsPerThread / 2));

    int occupied = engine.getLot().getParkingStatus().occupiedSpots();
    EXPECT_EQ(occupied, stats.admitted - stats.released);

    engine.stop();
}

TEST(StressTest, RapidStartStop) {
    Config config;
    config.numGates = 3;
    config.logEnabled = false;

    for (int i = 0; i < 10; ++i) {
        ParkingSimulation engine(config);
        engine.start();

        engine.requestEntry(VehicleClass::Compact);
        engine.requestEntry(VehicleClass::TwoWheeler);

        engine.stop();
        EXPECT_EQ(engine.getStats().admitted, 2);
    }
}

// ============== Main ==============

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
