#include "detector/screen_text.hpp"

#include <algorithm>

namespace screen {

namespace {

constexpr std::string_view kLightVertical = "\xE2\x94\x82";
constexpr std::string_view kHeavyVertical = "\xE2\x94\x83";
constexpr std::string_view kNoBreakSpace = "\xC2\xA0";

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // namespace

std::string strip_ansi(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); i++) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == 0x1B) {
            if (i + 1 >= text.size()) break;
            char kind = text[i + 1];
            if (kind == '[') {
                // CSI: parameters then a final byte in 0x40..0x7E
                i += 2;
                while (i < text.size()) {
                    unsigned char f = static_cast<unsigned char>(text[i]);
                    if (f >= 0x40 && f <= 0x7E) break;
                    i++;
                }
            } else if (kind == ']') {
                // OSC: terminated by BEL or ST (ESC \)
                i += 2;
                while (i < text.size()) {
                    if (text[i] == '\x07') break;
                    if (text[i] == '\x1B' && i + 1 < text.size() && text[i + 1] == '\\') {
                        i++;
                        break;
                    }
                    i++;
                }
            } else {
                i++;
            }
            continue;
        }
        if (c < 0x20 && c != '\n' && c != '\t') continue;
        if (c == 0x7F) continue;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        auto pos = text.find('\n', start);
        if (pos == std::string_view::npos) {
            if (start < text.size()) lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string trim(std::string_view s) {
    while (true) {
        if (!s.empty() && is_space(s.front())) {
            s.remove_prefix(1);
        } else if (s.starts_with(kNoBreakSpace)) {
            s.remove_prefix(kNoBreakSpace.size());
        } else {
            break;
        }
    }
    while (true) {
        if (!s.empty() && is_space(s.back())) {
            s.remove_suffix(1);
        } else if (s.ends_with(kNoBreakSpace)) {
            s.remove_suffix(kNoBreakSpace.size());
        } else {
            break;
        }
    }
    return std::string(s);
}

bool is_separator_line(std::string_view line) {
    bool seen_box = false;
    size_t i = 0;
    while (i < line.size()) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (is_space(line[i])) {
            i++;
            continue;
        }
        if (c == 0xE2 && i + 2 < line.size()) {
            unsigned char c1 = static_cast<unsigned char>(line[i + 1]);
            if (c1 == 0x94 || c1 == 0x95) {
                seen_box = true;
                i += 3;
                continue;
            }
        }
        return false;
    }
    return seen_box;
}

std::string strip_box_border(std::string_view line) {
    auto t = trim(line);
    std::string_view s = t;
    bool changed = true;
    while (changed) {
        changed = false;
        for (auto border : {kLightVertical, kHeavyVertical}) {
            if (s.starts_with(border)) {
                s.remove_prefix(border.size());
                changed = true;
            }
            if (s.ends_with(border)) {
                s.remove_suffix(border.size());
                changed = true;
            }
        }
    }
    return trim(s);
}

std::string_view first_codepoint(std::string_view s) {
    if (s.empty()) return {};
    unsigned char c = static_cast<unsigned char>(s[0]);
    size_t len = 1;
    if (c >= 0xF0) len = 4;
    else if (c >= 0xE0) len = 3;
    else if (c >= 0xC0) len = 2;
    return s.substr(0, std::min(len, s.size()));
}

std::vector<std::string> tail_lines(std::string_view text, int limit) {
    auto lines = split_lines(text);
    std::vector<std::string> out;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (static_cast<int>(out.size()) >= limit) break;
        if (is_separator_line(*it)) continue;
        auto stripped = strip_box_border(*it);
        if (stripped.empty() || is_separator_line(stripped)) continue;
        out.push_back(std::move(stripped));
    }
    return out;
}

} // namespace screen
