#include "termbar/progress/layout.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace termbar {
namespace progress {

Layout computeLayout(int screen_width, size_t label_length, size_t eta_length, int min_bar_width) {
    using constants::progress::BORDER_WIDTH;
    using constants::progress::WHITESPACE;
    
    const int label = static_cast<int>(label_length);
    const int eta = static_cast<int>(eta_length);
    
    Layout layout;
    layout.bar_width = std::max(min_bar_width, screen_width - label - eta - WHITESPACE);
    layout.label_width = label;
    
    if (label + layout.bar_width + eta + WHITESPACE > screen_width) {
        int available = screen_width - layout.bar_width - eta - WHITESPACE;
        layout.label_width = std::clamp(available, 0, label);
    }
    
    layout.interior_width = std::max(0, layout.bar_width - BORDER_WIDTH);
    return layout;
}

int filledPieces(int interior_width, uint64_t value, uint64_t max) {
    if (interior_width <= 0) {
        return 0;
    }
    if (value >= max) {
        return interior_width;
    }
    
    const uint64_t interior = static_cast<uint64_t>(interior_width);
    uint64_t filled;
    if (value <= std::numeric_limits<uint64_t>::max() / interior) {
        uint64_t scaled = interior * value;
        filled = scaled / max + (scaled % max != 0 ? 1 : 0);
    } else {
        long double fraction = static_cast<long double>(value) / static_cast<long double>(max);
        filled = static_cast<uint64_t>(std::ceil(fraction * interior));
    }
    return static_cast<int>(std::min<uint64_t>(filled, interior));
}

}}
