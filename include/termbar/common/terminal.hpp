#pragma once

namespace termbar {
namespace common {

// Column count of the terminal attached to fd, or fallback_width when fd is
// not a terminal or the query fails.
int queryTerminalWidth(int fd, int fallback_width);

}}
