#include "wrappee/ansi_filter.hpp"

namespace wrapmcp::wrappee {

namespace {

constexpr char kEscape = '\x1b';
constexpr char kBell = '\x07';

// Returns the index just past a CSI sequence that starts at `pos` ("ESC [").
std::size_t skip_csi(const std::string& text, std::size_t pos) {
    pos += 2;
    // Parameter and intermediate bytes, then one final byte in 0x40..0x7E.
    while (pos < text.size()) {
        const auto c = static_cast<unsigned char>(text[pos]);
        ++pos;
        if (c >= 0x40 && c <= 0x7E) {
            break;
        }
    }
    return pos;
}

// OSC runs until BEL or "ESC \".
std::size_t skip_osc(const std::string& text, std::size_t pos) {
    pos += 2;
    while (pos < text.size()) {
        if (text[pos] == kBell) {
            return pos + 1;
        }
        if (text[pos] == kEscape && pos + 1 < text.size() && text[pos + 1] == '\\') {
            return pos + 2;
        }
        ++pos;
    }
    return pos;
}

}  // namespace

std::string strip_ansi(const std::string& text) {
    if (text.find(kEscape) == std::string::npos) {
        return text;
    }

    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != kEscape) {
            out.push_back(text[pos]);
            ++pos;
            continue;
        }
        if (pos + 1 >= text.size()) {
            // Lone trailing ESC
            break;
        }
        const char next = text[pos + 1];
        if (next == '[') {
            pos = skip_csi(text, pos);
        } else if (next == ']') {
            pos = skip_osc(text, pos);
        } else {
            pos += 2;
        }
    }
    return out;
}

}  // namespace wrapmcp::wrappee
