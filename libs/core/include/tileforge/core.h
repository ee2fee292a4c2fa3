#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tileforge {

// --- Directions ---

enum class Direction : uint8_t { North, South, East, West };

inline constexpr std::array<Direction, 4> all_directions = {
    Direction::North, Direction::South, Direction::East, Direction::West,
};

constexpr Direction opposite(Direction d) {
    switch (d) {
        case Direction::North: return Direction::South;
        case Direction::South: return Direction::North;
        case Direction::East: return Direction::West;
        case Direction::West: return Direction::East;
    }
    return Direction::North;
}

// Grid offsets: y grows southwards.
constexpr int dx(Direction d) {
    return d == Direction::East ? 1 : (d == Direction::West ? -1 : 0);
}

constexpr int dy(Direction d) {
    return d == Direction::South ? 1 : (d == Direction::North ? -1 : 0);
}

constexpr const char* to_string(Direction d) {
    switch (d) {
        case Direction::North: return "north";
        case Direction::South: return "south";
        case Direction::East: return "east";
        case Direction::West: return "west";
    }
    return "north";
}

inline std::optional<Direction> parse_direction(std::string_view s) {
    if (s == "north") return Direction::North;
    if (s == "south") return Direction::South;
    if (s == "east") return Direction::East;
    if (s == "west") return Direction::West;
    return std::nullopt;
}

// DirectionSet is a small bitset over the four cardinal directions.
class DirectionSet {
public:
    constexpr DirectionSet() = default;
    constexpr DirectionSet(std::initializer_list<Direction> dirs) {
        for (auto d : dirs) insert(d);
    }

    constexpr void insert(Direction d) { bits_ |= bit(d); }
    constexpr void erase(Direction d) { bits_ &= static_cast<uint8_t>(~bit(d)); }
    constexpr bool contains(Direction d) const { return (bits_ & bit(d)) != 0; }
    constexpr bool empty() const { return bits_ == 0; }

    constexpr int size() const {
        int n = 0;
        for (auto d : all_directions) n += contains(d) ? 1 : 0;
        return n;
    }

    constexpr DirectionSet with(Direction d) const {
        DirectionSet out = *this;
        out.insert(d);
        return out;
    }

    constexpr DirectionSet united(DirectionSet other) const {
        DirectionSet out;
        out.bits_ = static_cast<uint8_t>(bits_ | other.bits_);
        return out;
    }

    // Members in north, south, east, west order.
    std::vector<Direction> to_vector() const {
        std::vector<Direction> out;
        for (auto d : all_directions) {
            if (contains(d)) out.push_back(d);
        }
        return out;
    }

    constexpr uint8_t bits() const { return bits_; }

    friend constexpr bool operator==(DirectionSet a, DirectionSet b) { return a.bits_ == b.bits_; }

private:
    static constexpr uint8_t bit(Direction d) { return static_cast<uint8_t>(1u << static_cast<unsigned>(d)); }

    uint8_t bits_ = 0;
};

// to_string renders a set as "[north, east]".
inline std::string to_string(DirectionSet set) {
    std::string out = "[";
    bool first = true;
    for (auto d : set.to_vector()) {
        if (!first) out += ", ";
        out += to_string(d);
        first = false;
    }
    out += ']';
    return out;
}

// --- Grid coordinates ---

struct Point {
    int x = 0;
    int y = 0;

    friend constexpr bool operator==(const Point&, const Point&) = default;
    friend constexpr bool operator<(const Point& a, const Point& b) {
        return a.y != b.y ? a.y < b.y : a.x < b.x;
    }
};

constexpr Point step(Point p, Direction d) { return {p.x + dx(d), p.y + dy(d)}; }

constexpr int manhattan(Point a, Point b) {
    return (a.x > b.x ? a.x - b.x : b.x - a.x) + (a.y > b.y ? a.y - b.y : b.y - a.y);
}

// direction_between returns the direction from a to a 4-adjacent b.
constexpr std::optional<Direction> direction_between(Point a, Point b) {
    int ddx = b.x - a.x;
    int ddy = b.y - a.y;
    if (ddx == 1 && ddy == 0) return Direction::East;
    if (ddx == -1 && ddy == 0) return Direction::West;
    if (ddx == 0 && ddy == 1) return Direction::South;
    if (ddx == 0 && ddy == -1) return Direction::North;
    return std::nullopt;
}

// --- Layers ---

enum class Layer : uint8_t { Ground, Object };

constexpr const char* to_string(Layer l) {
    return l == Layer::Ground ? "ground" : "object";
}

inline std::optional<Layer> parse_layer(std::string_view s) {
    if (s == "ground") return Layer::Ground;
    if (s == "object" || s == "objects") return Layer::Object;
    return std::nullopt;
}

// --- Recoverable failures ---

enum class Error {
    None,
    OutOfBounds,
    UnknownTile,
    NoMatchingConnectivity,
    DisconnectedPlacement,
    BudgetExceeded,
    NotARoadTile,
    NotGroundTile,
    ConnectivityMismatch,
    MissingGround,
    CellOccupied,
};

constexpr const char* to_string(Error e) {
    switch (e) {
        case Error::None: return "none";
        case Error::OutOfBounds: return "out_of_bounds";
        case Error::UnknownTile: return "unknown_tile";
        case Error::NoMatchingConnectivity: return "no_matching_connectivity";
        case Error::DisconnectedPlacement: return "disconnected_placement";
        case Error::BudgetExceeded: return "budget_exceeded";
        case Error::NotARoadTile: return "not_a_road_tile";
        case Error::NotGroundTile: return "not_ground_tile";
        case Error::ConnectivityMismatch: return "connectivity_mismatch";
        case Error::MissingGround: return "missing_ground";
        case Error::CellOccupied: return "cell_occupied";
    }
    return "none";
}

} // namespace tileforge
