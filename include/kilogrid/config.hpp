#pragma once

#include "kilogrid/types.hpp"

namespace kilogrid {

    /// Board construction parameters.
    ///
    /// Either dimension may be zero; the resulting board simply has no valid cells.
    struct Config {
        Coord width = 10;
        Coord height = 10;
    };

} // namespace kilogrid
