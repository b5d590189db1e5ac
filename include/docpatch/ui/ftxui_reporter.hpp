#pragma once

#include "docpatch/interfaces.hpp"
#include "docpatch/ui/report.hpp"
#include <ftxui/dom/elements.hpp>
#include <iosfwd>
#include <string>

namespace docpatch {

// Renders report screens once to a stream with the FTXUI DOM. No event
// loop: output works the same when stdout is a pipe.
class FtxuiReporter : public IReporter {
private:
    std::ostream& out_;

public:
    explicit FtxuiReporter(std::ostream& out);

    auto display_screen(const Screen& screen) -> void override;

    static auto screen_to_element(const Screen& screen) -> ftxui::Element;
    static auto render_to_string(const Screen& screen) -> std::string;
};

} // namespace docpatch
