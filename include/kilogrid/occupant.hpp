#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include "kilogrid/types.hpp"

namespace kilogrid {

    /// A bot together with the direction it faces, as stored in one board cell.
    ///
    /// Only Board creates occupants (on a successful place) and only a successful
    /// remove hands one back to the caller. The bot is owned by the occupant for
    /// its whole life on the board.
    template <typename Bot> class Occupant {
      public:
        Occupant(Bot bot, Facing facing) : bot_(std::move(bot)), facing_(facing) {}

        /// Read-only access to the bot; its state cannot be changed through this.
        inline const Bot &agent() const { return bot_; }

        /// Mutable access to the bot, for updating its internal state in place.
        inline Bot &agent_mut() { return bot_; }

        /// Degrees clockwise from north.
        inline Facing facing() const { return facing_; }

        /// No range check or normalisation; the value is stored as given.
        inline void set_facing(Facing new_facing) { facing_ = new_facing; }

        /// Moves the bot out of an occupant that has already left the board.
        inline Bot into_agent() && { return std::move(bot_); }

      private:
        Bot bot_;
        Facing facing_ = NORTH;
    };

    template <typename Bot> std::ostream &operator<<(std::ostream &os, const Occupant<Bot> &occ) {
        return os << "[Bot: " << occ.agent() << ", Facing: " << occ.facing() << "]";
    }

    template <typename Bot> std::string to_string(const Occupant<Bot> &occ) {
        std::ostringstream ss;
        ss << occ;
        return ss.str();
    }

} // namespace kilogrid
