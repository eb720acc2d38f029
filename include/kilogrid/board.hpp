#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/pods/adapters/result.hpp>

#include "kilogrid/config.hpp"
#include "kilogrid/occupant.hpp"
#include "kilogrid/types.hpp"

namespace kilogrid {

    /// Fixed-size grid of cells, each empty or holding exactly one Occupant.
    ///
    /// Cells are packed row-major into one buffer: index(x, y) = x + y * width.
    /// The buffer is sized once at construction and never grows or shrinks.
    ///
    /// `Bot` is any movable type exposing `uid()`; the board never looks past that.
    /// There is no internal locking. Callers sharing a board between threads must
    /// serialise every call themselves.
    template <typename Bot> class Board {
      public:
        using OccupantType = Occupant<Bot>;
        using Cell = dp::Optional<OccupantType>;

        Board(Coord width, Coord height) : width_(width), height_(height) {
            const Index n = static_cast<Index>(width_) * static_cast<Index>(height_);
            cells_.reserve(n);
            for (Index i = 0; i < n; ++i) {
                cells_.emplace_back();
            }
        }

        static Board from_config(const Config &cfg) { return Board(cfg.width, cfg.height); }

        inline Coord width() const { return width_; }
        inline Coord height() const { return height_; }
        inline Index size() const { return cells_.size(); }

        // -----------------------------------------------------------------------------------------
        // Coordinates
        // -----------------------------------------------------------------------------------------

        /// Row-major index of (x, y). Every coordinate-based call goes through here.
        inline Result<Index> coordinate_to_index(Coord x, Coord y) const {
            if (x >= width_ || y >= height_) {
                return Result<Index>::err(LocationError::OutOfBounds);
            }
            return Result<Index>::ok(static_cast<Index>(x) + static_cast<Index>(y) * static_cast<Index>(width_));
        }

        inline Result<Position> index_to_coordinate(Index index) const {
            if (index >= cells_.size()) {
                return Result<Position>::err(LocationError::OutOfBounds);
            }
            Position p;
            p.x = static_cast<Coord>(index % width_);
            p.y = static_cast<Coord>(index / width_);
            return Result<Position>::ok(p);
        }

        // -----------------------------------------------------------------------------------------
        // Placement / removal
        // -----------------------------------------------------------------------------------------

        /// Put `bot` on (x, y) facing `facing`. Returns the cell index on success.
        ///
        /// On failure nothing is written and `bot` is dropped with the call.
        inline Result<Index> place(Bot bot, Coord x, Coord y, Facing facing) {
            auto index = coordinate_to_index(x, y);
            if (index.is_err()) {
                return Result<Index>::err(index.error());
            }

            auto &cell = cells_[index.value()];
            if (cell.has_value()) {
                return Result<Index>::err(LocationError::AlreadyOccupied);
            }

            cell.emplace(std::move(bot), facing);
            echo::trace("placed bot ", cell->agent().uid(), " at ", Position{x, y}, " facing ", facing);
            return Result<Index>::ok(index.value());
        }

        inline Result<OccupantType> remove_at(Coord x, Coord y) {
            auto index = coordinate_to_index(x, y);
            if (index.is_err()) {
                return Result<OccupantType>::err(index.error());
            }
            return remove_at_index(index.value());
        }

        /// Take the occupant out of cell `index`, leaving the cell empty.
        inline Result<OccupantType> remove_at_index(Index index) {
            if (index >= cells_.size()) {
                return Result<OccupantType>::err(LocationError::OutOfBounds);
            }

            auto &cell = cells_[index];
            if (!cell.has_value()) {
                return Result<OccupantType>::err(LocationError::NotOccupied);
            }

            OccupantType taken = std::move(*cell);
            cell.reset();
            echo::trace("removed bot ", taken.agent().uid(), " from index ", index);
            return Result<OccupantType>::ok(std::move(taken));
        }

        // -----------------------------------------------------------------------------------------
        // Lookup
        // -----------------------------------------------------------------------------------------

        inline Result<bool> is_occupied(Coord x, Coord y) const {
            auto index = coordinate_to_index(x, y);
            if (index.is_err()) {
                return Result<bool>::err(index.error());
            }
            return Result<bool>::ok(cells_[index.value()].has_value());
        }

        inline Result<const OccupantType *> get_occupant_at(Coord x, Coord y) const {
            auto index = coordinate_to_index(x, y);
            if (index.is_err()) {
                return Result<const OccupantType *>::err(index.error());
            }
            return get_occupant_at_index(index.value());
        }

        inline Result<const OccupantType *> get_occupant_at_index(Index index) const {
            if (index >= cells_.size()) {
                return Result<const OccupantType *>::err(LocationError::OutOfBounds);
            }
            const auto &cell = cells_[index];
            if (!cell.has_value()) {
                return Result<const OccupantType *>::err(LocationError::NotOccupied);
            }
            return Result<const OccupantType *>::ok(&(*cell));
        }

        /// Mutable occupant access, e.g. to turn a bot without lifting it off the board.
        inline Result<OccupantType *> get_occupant_at_mut(Coord x, Coord y) {
            auto index = coordinate_to_index(x, y);
            if (index.is_err()) {
                return Result<OccupantType *>::err(index.error());
            }
            return get_occupant_at_index_mut(index.value());
        }

        inline Result<OccupantType *> get_occupant_at_index_mut(Index index) {
            if (index >= cells_.size()) {
                return Result<OccupantType *>::err(LocationError::OutOfBounds);
            }
            auto &cell = cells_[index];
            if (!cell.has_value()) {
                return Result<OccupantType *>::err(LocationError::NotOccupied);
            }
            return Result<OccupantType *>::ok(&(*cell));
        }

        inline Result<const Bot *> get_agent_at(Coord x, Coord y) const {
            auto index = coordinate_to_index(x, y);
            if (index.is_err()) {
                return Result<const Bot *>::err(index.error());
            }
            return get_agent_at_index(index.value());
        }

        inline Result<const Bot *> get_agent_at_index(Index index) const {
            auto occ = get_occupant_at_index(index);
            if (occ.is_err()) {
                return Result<const Bot *>::err(occ.error());
            }
            return Result<const Bot *>::ok(&occ.value()->agent());
        }

        inline Result<Bot *> get_agent_at_mut(Coord x, Coord y) {
            auto index = coordinate_to_index(x, y);
            if (index.is_err()) {
                return Result<Bot *>::err(index.error());
            }
            return get_agent_at_index_mut(index.value());
        }

        inline Result<Bot *> get_agent_at_index_mut(Index index) {
            auto occ = get_occupant_at_index_mut(index);
            if (occ.is_err()) {
                return Result<Bot *>::err(occ.error());
            }
            return Result<Bot *>::ok(&occ.value()->agent_mut());
        }

        // -----------------------------------------------------------------------------------------
        // Diagnostics
        // -----------------------------------------------------------------------------------------

        /// Full scan; there is no running counter.
        inline Index occupied_count() const {
            Index n = 0;
            for (Index i = 0; i < cells_.size(); ++i) {
                if (cells_[i].has_value()) {
                    ++n;
                }
            }
            return n;
        }

        /// Top row first, left to right. Occupied cells show the bot uid, empty
        /// cells their own coordinates. Rows are separated by a blank line.
        inline std::string render() const {
            std::ostringstream ss;
            for (Coord y = 0; y < height_; ++y) {
                for (Coord x = 0; x < width_; ++x) {
                    const auto &cell = cells_[coordinate_to_index(x, y).value()];
                    if (cell.has_value()) {
                        ss << "  " << cell->agent().uid() << "   ";
                    } else {
                        ss << Position{x, y} << " ";
                    }
                }
                ss << "\n\n";
            }
            return ss.str();
        }

        inline std::string summary() const {
            std::ostringstream ss;
            ss << "(width:" << width_ << ", height:" << height_ << ", number of bots:" << occupied_count() << ")";
            return ss.str();
        }

      private:
        Coord width_ = 0;
        Coord height_ = 0;
        dp::Vector<Cell> cells_;
    };

    template <typename Bot> std::ostream &operator<<(std::ostream &os, const Board<Bot> &board) {
        return os << board.summary();
    }

    template <typename Bot> std::string to_string(const Board<Bot> &board) { return board.summary(); }

} // namespace kilogrid
