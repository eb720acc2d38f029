#include <kilogrid.hpp>

#include <argu/argu.hpp>
#include <echo/echo.hpp>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>

namespace {
    using BotBoard = kilogrid::Board<kilogrid::model::Bot>;

    template <typename T> bool parse_uint(const std::string &s, T &out) {
        const char *first = s.data();
        const char *last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc{} && ptr == last;
    }

    /// Drop `count` bots on random free cells. Returns how many were placed.
    uint32_t scatter(BotBoard &board, uint32_t count, uint32_t seed) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<kilogrid::Coord> pick_x(0, board.width() - 1);
        std::uniform_int_distribution<kilogrid::Coord> pick_y(0, board.height() - 1);
        std::uniform_int_distribution<int> pick_heading(0, 3);

        uint32_t placed = 0;
        for (uint32_t uid = 1; uid <= count && board.occupied_count() < board.size(); ++uid) {
            // Bounded retries; a crowded board can still reject every guess.
            for (int attempt = 0; attempt < 64; ++attempt) {
                const auto facing = static_cast<kilogrid::Facing>(pick_heading(rng) * 90);
                auto res = board.place(kilogrid::model::Bot(uid, "kb" + std::to_string(uid)), pick_x(rng),
                                       pick_y(rng), facing);
                if (res.is_ok()) {
                    ++placed;
                    break;
                }
            }
        }
        return placed;
    }

    /// Move the bot at `from` one cell ahead of where it faces.
    /// Nothing changes when the target is off the board or already taken.
    bool step_forward(BotBoard &board, kilogrid::Index from) {
        auto pos = board.index_to_coordinate(from);
        auto here = board.get_occupant_at_index(from);
        if (pos.is_err() || here.is_err()) {
            return false;
        }

        int tx = pos.value().x;
        int ty = pos.value().y;
        switch (here.value()->facing()) {
        case kilogrid::NORTH:
            --ty;
            break;
        case kilogrid::EAST:
            ++tx;
            break;
        case kilogrid::SOUTH:
            ++ty;
            break;
        case kilogrid::WEST:
            --tx;
            break;
        default:
            return false;
        }
        if (tx < 0 || ty < 0) {
            return false;
        }

        const auto to_x = static_cast<kilogrid::Coord>(tx);
        const auto to_y = static_cast<kilogrid::Coord>(ty);
        auto taken = board.is_occupied(to_x, to_y);
        if (taken.is_err() || taken.value()) {
            echo("bot ", here.value()->agent().uid(), " blocked at ", pos.value());
            return false;
        }

        auto lifted = board.remove_at_index(from);
        if (lifted.is_err()) {
            return false;
        }
        const auto facing = lifted.value().facing();
        auto res = board.place(std::move(lifted.value()).into_agent(), to_x, to_y, facing);
        return res.is_ok();
    }
} // namespace

int main(int argc, char *argv[]) {
    std::string width_s;
    std::string height_s;
    std::string bots_s;
    std::string seed_s;

    auto cmd = argu::Command("board_demo")
                   .version("1.0.0")
                   .about("Scatter kilobots on a board, nudge them around, print the board")
                   .auto_exit()
                   .arg(argu::Arg("width")
                            .positional()
                            .help("Board width in cells")
                            .value_of(width_s)
                            .value_name("WIDTH")
                            .default_value("6"))
                   .arg(argu::Arg("height")
                            .positional()
                            .help("Board height in cells")
                            .value_of(height_s)
                            .value_name("HEIGHT")
                            .default_value("4"))
                   .arg(argu::Arg("bots")
                            .positional()
                            .help("Number of bots to scatter")
                            .value_of(bots_s)
                            .value_name("BOTS")
                            .default_value("5"))
                   .arg(argu::Arg("seed")
                            .positional()
                            .help("Placement seed")
                            .value_of(seed_s)
                            .value_name("SEED")
                            .default_value("7"));

    auto result = cmd.parse(argc, argv);
    if (!result) {
        return result.exit();
    }

    kilogrid::Config cfg;
    uint32_t bots = 0;
    uint32_t seed = 0;
    if (!parse_uint(width_s, cfg.width) || !parse_uint(height_s, cfg.height) || !parse_uint(bots_s, bots) ||
        !parse_uint(seed_s, seed)) {
        std::cerr << "width, height, bots and seed must be non-negative integers\n";
        return 1;
    }

    auto board = BotBoard::from_config(cfg);
    echo("Board: ", board);

    if (board.size() == 0) {
        echo("board has no cells; nothing to place");
        std::cout << board << "\n";
        return 0;
    }

    const auto placed = scatter(board, bots, seed);
    echo("placed ", placed, " of ", bots, " bots");
    std::cout << board.render();

    // One controller tick: every bot blinks and turns clockwise in place.
    for (kilogrid::Index i = 0; i < board.size(); ++i) {
        auto occ = board.get_occupant_at_index_mut(i);
        if (occ.is_err()) {
            continue;
        }
        auto *o = occ.value();
        o->agent_mut().tick();
        o->agent_mut().set_light(0, 255, 0);
        o->set_facing(static_cast<kilogrid::Facing>((o->facing() + 90) % 360));
    }

    // Then each bot tries to step forward. Collect first so a bot is never moved twice.
    dp::Vector<kilogrid::Index> occupied;
    for (kilogrid::Index i = 0; i < board.size(); ++i) {
        if (board.get_agent_at_index(i).is_ok()) {
            occupied.push_back(i);
        }
    }
    uint32_t moved = 0;
    for (auto i : occupied) {
        if (step_forward(board, i)) {
            ++moved;
        }
    }
    echo("moved ", moved, " of ", occupied.size(), " bots");

    std::cout << board.render();

    if (!occupied.empty()) {
        auto pos = board.index_to_coordinate(occupied[0]);
        if (pos.is_ok()) {
            auto removed = board.remove_at(pos.value().x, pos.value().y);
            if (removed.is_ok()) {
                echo("removed ", removed.value());
            } else {
                echo("nothing to remove at ", pos.value(), ": ", removed.error());
            }
        }
    }

    std::cout << board << "\n";
    return 0;
}
