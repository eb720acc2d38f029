#pragma once

// Single-include convenience header for kilogrid.

#include "kilogrid/board.hpp"
#include "kilogrid/config.hpp"
#include "kilogrid/model/bot.hpp"
#include "kilogrid/occupant.hpp"
#include "kilogrid/types.hpp"
