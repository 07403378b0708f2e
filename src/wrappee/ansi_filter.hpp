#pragma once

#include <string>

namespace wrapmcp::wrappee {

// Removes terminal escape sequences (CSI such as colors and cursor moves, OSC titles,
// two-byte ESC sequences). Text without an ESC byte is returned unchanged.
std::string strip_ansi(const std::string& text);

}  // namespace wrapmcp::wrappee
