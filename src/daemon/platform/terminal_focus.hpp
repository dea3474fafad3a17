#pragma once

#include <expected>
#include <string>

class TerminalFocus {
public:
    virtual ~TerminalFocus() = default;
    virtual std::expected<void, std::string> focus(const std::string& tmux_pane,
                                                   const std::string& terminal_bundle_id) = 0;
};
