#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>


namespace kilogrid {
    namespace model {

        struct Identity {
            uint32_t uid = 0;
            std::string name;
        };

        /// RGB status LED, the only actuator a kilobot exposes besides its motors.
        struct Light {
            uint8_t r = 0;
            uint8_t g = 0;
            uint8_t b = 0;

            bool operator==(const Light &other) const { return r == other.r && g == other.g && b == other.b; }
        };

        struct Runtime {
            uint64_t tick_seq = 0;
            Light light{};
        };

        /// Reference agent carried on a Board.
        ///
        /// Position and heading belong to the board; the bot only keeps its own
        /// identity and the state a controller mutates between ticks.
        struct Bot {
            Identity identity;
            Runtime runtime;

            Bot() = default;
            explicit Bot(uint32_t uid, std::string name = {}) {
                identity.uid = uid;
                identity.name = std::move(name);
            }

            inline uint32_t uid() const { return identity.uid; }

            inline void tick() { ++runtime.tick_seq; }
            inline void set_light(uint8_t r, uint8_t g, uint8_t b) { runtime.light = Light{r, g, b}; }
        };

        inline std::ostream &operator<<(std::ostream &os, const Bot &bot) {
            return os << "Kilobot{uid:" << bot.identity.uid << ", name:" << bot.identity.name << "}";
        }

    } // namespace model
} // namespace kilogrid
