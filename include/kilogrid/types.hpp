#pragma once

#include <ostream>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/result.hpp>

namespace kilogrid {

    using Coord = dp::u16;
    using Facing = dp::u16;
    using Index = dp::usize;

    // Canonical headings, degrees clockwise from north. Any value in [0, 360) is legal.
    static constexpr Facing NORTH = 0;
    static constexpr Facing EAST = 90;
    static constexpr Facing SOUTH = 180;
    static constexpr Facing WEST = 270;

    /// Reason a board operation was rejected.
    ///
    /// All three are expected outcomes of normal use (probing an unknown cell,
    /// racing another bot for a square) and never leave the board modified.
    enum class LocationError : dp::u8 {
        OutOfBounds = 0,
        AlreadyOccupied = 1,
        NotOccupied = 2,
    };

    template <typename T> using Result = dp::Result<T, LocationError>;

    inline const char *to_string(LocationError e) {
        switch (e) {
        case LocationError::OutOfBounds:
            return "out of bounds";
        case LocationError::AlreadyOccupied:
            return "already occupied";
        case LocationError::NotOccupied:
            return "not occupied";
        default:
            return "unknown";
        }
    }

    inline std::ostream &operator<<(std::ostream &os, LocationError e) { return os << to_string(e); }

    struct Position {
        Coord x = 0;
        Coord y = 0;

        bool operator==(const Position &other) const { return x == other.x && y == other.y; }
        bool operator!=(const Position &other) const { return !(*this == other); }
    };

    inline std::ostream &operator<<(std::ostream &os, const Position &p) {
        return os << "(" << p.x << "," << p.y << ")";
    }

} // namespace kilogrid
