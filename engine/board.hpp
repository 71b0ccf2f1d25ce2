#pragma once
#include <array>
#include "state.hpp"

namespace peril {

enum class PlaceResult { Ok, OutOfBounds, PositionOccupied, UnknownOwner };

inline std::string_view to_string(PlaceResult r) {
    switch (r) {
        case PlaceResult::Ok:               return "ok";
        case PlaceResult::OutOfBounds:      return "out_of_bounds";
        case PlaceResult::PositionOccupied: return "position_occupied";
        case PlaceResult::UnknownOwner:     return "unknown_owner";
    }
    return "unknown";
}

bool inBounds(const GameConfig& cfg, Position p);

// The six odd-row-offset hex neighbours of p (may lie off the board).
std::array<Position, 6> hexNeighbors(Position p);

// Service id at p, or -1 when the cell is empty.
int serviceAt(const GameState& s, Position p);

// Create a service at `pos` for `owner` and link it to every occupied
// neighbour. On failure nothing is touched. `outId` receives the new id.
PlaceResult placeService(GameState& s, ServiceKind kind, Position pos, int owner,
                         int* outId = nullptr);

// Symmetric edge maintenance.
void connectServices(GameState& s, int a, int b);
void disconnectServices(GameState& s, int a, int b);

} // namespace peril
