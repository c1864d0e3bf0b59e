#include "termbar/common/terminal.hpp"
#include <sys/ioctl.h>

namespace termbar {
namespace common {

int queryTerminalWidth(int fd, int fallback_width) {
    struct winsize w;
    if (ioctl(fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return fallback_width;
}

}}
