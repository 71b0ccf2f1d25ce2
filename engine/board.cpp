#include "board.hpp"

namespace peril {

bool inBounds(const GameConfig& cfg, Position p) {
    return p.row >= 0 && p.row < cfg.boardRows && p.col >= 0 && p.col < cfg.boardCols;
}

std::array<Position, 6> hexNeighbors(Position p) {
    const int r = p.row, c = p.col;
    if (r % 2 == 0) {
        return {{ {r-1, c-1}, {r-1, c},
                  {r,   c-1}, {r,   c+1},
                  {r+1, c-1}, {r+1, c} }};
    }
    return {{ {r-1, c}, {r-1, c+1},
              {r,   c-1}, {r,   c+1},
              {r+1, c}, {r+1, c+1} }};
}

int serviceAt(const GameState& s, Position p) {
    auto it = s.board.find(p);
    return it == s.board.end() ? -1 : it->second;
}

void connectServices(GameState& s, int a, int b) {
    if (a == b) return;
    Service* sa = s.findService(a);
    Service* sb = s.findService(b);
    if (!sa || !sb) return;
    sa->connections.insert(b);
    sb->connections.insert(a);
}

void disconnectServices(GameState& s, int a, int b) {
    if (Service* sa = s.findService(a)) sa->connections.erase(b);
    if (Service* sb = s.findService(b)) sb->connections.erase(a);
}

PlaceResult placeService(GameState& s, ServiceKind kind, Position pos, int owner, int* outId) {
    if (!inBounds(s.config, pos)) return PlaceResult::OutOfBounds;
    if (s.board.count(pos)) return PlaceResult::PositionOccupied;
    Player* p = s.findPlayer(owner);
    if (!p) return PlaceResult::UnknownOwner;

    Service svc;
    svc.id    = s.nextServiceId++;
    svc.kind  = kind;
    svc.pos   = pos;
    svc.owner = owner;

    const int id = svc.id;
    s.services.emplace(id, std::move(svc));
    s.board[pos] = id;
    p->servicesOwned.insert(id);

    // Auto-connect: the only place edges are created.
    for (const Position& n : hexNeighbors(pos)) {
        int other = serviceAt(s, n);
        if (other >= 0) connectServices(s, id, other);
    }

    if (outId) *outId = id;
    return PlaceResult::Ok;
}

} // namespace peril
