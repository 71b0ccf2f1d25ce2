#include "test_support.hpp"
#include "../engine/board.hpp"
#include "../engine/cascade.hpp"
#include "../engine/dice.hpp"
#include "../engine/invariants.hpp"
#include "../engine/traffic.hpp"

using namespace peril;

static int64_t settled(const GameState& s) {
    return s.successfulRequests + s.failedRequests;
}

static bool logged(const GameState& s, EventKind kind) {
    for (const auto& e : s.eventLog) {
        if (e.kind == kind) return true;
    }
    return false;
}

int main() {
    const StepOpts opt = test::quietOpts();

    // Traffic is 2d10 and lands in the request counter.
    {
        GameState s = test::freshGame();
        for (int i = 0; i < 100; ++i) {
            const int64_t total = s.totalRequests;
            int n = generateTraffic(s, opt);
            assert(n >= 2 && n <= 20);
            assert(s.totalRequests == total + n);
            assert(s.lastDiceRoll && s.lastDiceRoll->die == DieKind::D10);
            assert(s.lastDiceRoll->rolls.size() == 2);
        }
        assert(s.eventLog.back().kind == EventKind::TrafficGenerated);
    }

    // Shares go to the balancers in id order; the first ones take the remainder.
    {
        GameState s = test::freshGame(2);
        processRequests(s, 5, opt);
        assert(s.services.at(1).load == 3);
        assert(s.services.at(2).load == 2);
        assert(s.successfulRequests == 5 && s.failedRequests == 0);
    }

    // No live balancer: everything fails.
    {
        GameState s = test::freshGame();
        for (auto& [id, svc] : s.services) svc.state = ServiceState::Failed;
        processRequests(s, 13, opt);
        assert(s.failedRequests == 13 && s.successfulRequests == 0);
        assert(logged(s, EventKind::AllRequestsFailed));
    }

    // Overload escalates one step per event; a small excess never fails.
    {
        GameState s = test::freshGame(1);
        processRequests(s, 11, opt);
        Service& lb = s.services.at(1);
        assert(lb.load == 11 && lb.state == ServiceState::Degraded);
        processRequests(s, 1, opt);
        assert(lb.state == ServiceState::Overloaded);
        processRequests(s, 1, opt);
        assert(lb.state == ServiceState::Overloaded);
        assert(s.successfulRequests == 13);
    }

    // A router whose only neighbour is down drops what it was given.
    {
        GameState s = test::freshGame(1);
        int compute = -1;
        assert(placeService(s, ServiceKind::Compute, Position{1, 2}, 0, &compute) == PlaceResult::Ok);
        s.services.at(compute).state = ServiceState::Failed;
        processRequests(s, 7, opt);
        assert(s.failedRequests == 7 && s.successfulRequests == 0);
        assert(s.services.at(1).load == 7);
    }

    // Even split downstream; the remainder of the split is counted as failed.
    {
        GameState s = test::freshGame(1);
        int a = -1, b = -1;
        assert(placeService(s, ServiceKind::Cache, Position{0, 1}, 0, &a) == PlaceResult::Ok);
        assert(placeService(s, ServiceKind::Queue, Position{2, 2}, 0, &b) == PlaceResult::Ok);
        assert(s.services.at(a).connections.size() == 1);
        processRequests(s, 7, opt);
        assert(s.services.at(a).load == 3 && s.services.at(b).load == 3);
        assert(s.successfulRequests == 6 && s.failedRequests == 1);
    }

    // Depth guard and unknown targets.
    {
        GameState s = test::freshGame(1);
        routeRequests(s, 1, 4, MAX_ROUTE_DEPTH + 1, opt);
        assert(s.failedRequests == 4 && s.services.at(1).load == 0);
        routeRequests(s, 999, 3, 0, opt);
        assert(s.failedRequests == 7);
    }

    // A negative volume from a driver has no effect.
    {
        GameState s = test::freshGame();
        processRequests(s, -7, opt);
        routeRequests(s, 1, -3, 0, opt);
        for (const auto& [id, svc] : s.services) {
            assert(svc.load == 0 && svc.state == ServiceState::Healthy);
        }
        assert(s.successfulRequests == 0 && s.failedRequests == 0);
        assert(checkInvariants(s, opt, false));
    }

    // Conservation through a looped router mesh, for any volume.
    {
        GameState s = test::freshGame(1, 2024);
        assert(placeService(s, ServiceKind::ApiGateway, Position{1, 2}, 0) == PlaceResult::Ok);
        assert(placeService(s, ServiceKind::Compute, Position{0, 2}, 0) == PlaceResult::Ok);
        assert(placeService(s, ServiceKind::LoadBalancer, Position{2, 2}, 0) == PlaceResult::Ok);
        assert(placeService(s, ServiceKind::Database, Position{2, 1}, 0) == PlaceResult::Ok);
        for (int n = 0; n <= 60; ++n) {
            const int64_t before = settled(s);
            processRequests(s, n, opt);
            assert(settled(s) - before == n);
            for (auto& [id, svc] : s.services) {
                assert(svc.load >= 0);
                svc.load = 0;
                svc.state = ServiceState::Healthy;
            }
        }
        assert(checkInvariants(s, opt, false));
    }

    // Far beyond capacity a service fails at the 0.8 cap.
    {
        GameState s = test::freshGame(1, 31337);
        const int trials = 4000;
        int failures = 0;
        for (int i = 0; i < trials; ++i) {
            Service& lb = s.services.at(1);
            lb.state = ServiceState::Overloaded;
            lb.load = 25;
            processRequests(s, 0, opt);
            if (s.services.at(1).state == ServiceState::Failed) ++failures;
        }
        const double rate = static_cast<double>(failures) / trials;
        assert(test::near(rate, MAX_FAILURE_CHANCE, 0.03));
        assert(logged(s, EventKind::ServiceFailed));
    }

    // Cascades: a contained roll touches nothing.
    {
        GameState s = test::freshGame(1);
        int gw = -1;
        assert(placeService(s, ServiceKind::ApiGateway, Position{1, 2}, 0, &gw) == PlaceResult::Ok);
        s.services.at(1).state = ServiceState::Failed;
        loadDice(s, {CASCADE_ROLL_MAX + 1});
        triggerCascadeCheck(s, 1, opt);
        assert(s.services.at(gw).state == ServiceState::Healthy);
        assert(s.services.at(gw).load == 0);
        assert(s.eventLog.back().kind == EventKind::CascadeContained);
    }

    // A low roll pushes live neighbours into Cascading with extra load.
    {
        GameState s = test::freshGame(1);
        int a = -1, b = -1, dead = -1;
        assert(placeService(s, ServiceKind::Cache, Position{0, 1}, 0, &a) == PlaceResult::Ok);
        assert(placeService(s, ServiceKind::Queue, Position{2, 2}, 0, &b) == PlaceResult::Ok);
        assert(placeService(s, ServiceKind::Compute, Position{1, 0}, 0, &dead) == PlaceResult::Ok);
        s.services.at(dead).state = ServiceState::Failed;
        s.services.at(1).state = ServiceState::Failed;
        // Every check in the chain rolls low.
        loadDice(s, std::vector<int>(16, 1));
        triggerCascadeCheck(s, 1, opt);
        assert(s.services.at(a).state == ServiceState::Cascading);
        assert(s.services.at(b).state == ServiceState::Cascading);
        assert(s.services.at(a).load >= CASCADE_LOAD);
        assert(s.services.at(dead).state == ServiceState::Failed);
        assert(s.services.at(dead).load == 0);
        assert(logged(s, EventKind::CascadeFailure));
    }

    // A fully occupied board still terminates; each service checks at most once.
    {
        GameState s = test::freshGame(1, 5);
        for (int r = 0; r < s.config.boardRows; ++r) {
            for (int c = 0; c < s.config.boardCols; ++c) {
                const Position p{r, c};
                if (serviceAt(s, p) >= 0) continue;
                assert(placeService(s, ServiceKind::Compute, p, 0) == PlaceResult::Ok);
            }
        }
        const int total = static_cast<int>(s.services.size());
        assert(total == 48);
        s.services.at(1).state = ServiceState::Failed;
        loadDice(s, std::vector<int>(static_cast<size_t>(total), 1));
        const size_t logBefore = s.eventLog.size();
        triggerCascadeCheck(s, 1, opt);
        const size_t checks = s.eventLog.size() - logBefore;
        assert(checks >= 1 && checks <= static_cast<size_t>(total));
        for (int id : s.services.at(1).connections) {
            assert(s.services.at(id).state == ServiceState::Cascading);
        }
        s.loadedDice.clear();
        assert(checkInvariants(s, opt, false));
    }
    return 0;
}
