#pragma once

#include "termbar/common/constants.hpp"
#include <cstddef>
#include <cstdint>

namespace termbar {
namespace progress {

struct Layout {
    int bar_width;       // including both border glyphs
    int interior_width;  // bar_width - BORDER_WIDTH
    int label_width;     // columns granted to the label, 0 when it is dropped
};

// Splits screen_width between label, bar and the ETA field. The bar never
// shrinks below min_bar_width; when space runs out the label is truncated
// first, then dropped.
Layout computeLayout(int screen_width,
                     size_t label_length,
                     size_t eta_length,
                     int min_bar_width = constants::limits::DEFAULT_MIN_BAR_WIDTH);

// ceil(interior_width * value / max), or the full interior once value >= max.
int filledPieces(int interior_width, uint64_t value, uint64_t max);

}}
