#include "docpatch/ui/ftxui_reporter.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>

#include <ostream>

namespace docpatch {

FtxuiReporter::FtxuiReporter(std::ostream& out) : out_(out) {}

auto FtxuiReporter::display_screen(const Screen& screen) -> void {
    out_ << render_to_string(screen) << '\n' << std::flush;
}

auto FtxuiReporter::screen_to_element(const Screen& screen) -> ftxui::Element {
    using namespace ftxui;

    Elements content_elements;
    for (const auto& line : screen.content) {
        if (line.is_highlighted) {
            content_elements.push_back(text(line.text) | color(Color::Green));
        } else {
            content_elements.push_back(text(line.text));
        }
    }

    auto content_box = vbox(std::move(content_elements));
    auto status_element = text(screen.status_line) | bold | color(Color::Cyan);
    auto hints_element = text(screen.control_hints) | dim;

    return vbox({
        content_box,
        separator(),
        status_element,
        hints_element
    });
}

auto FtxuiReporter::render_to_string(const Screen& screen) -> std::string {
    auto element = screen_to_element(screen);

    // Full width, but only as tall as the content
    auto ftxui_screen = ftxui::Screen::Create(
        ftxui::Dimension::Full(),
        ftxui::Dimension::Fit(element)
    );

    ftxui::Render(ftxui_screen, element);
    return ftxui_screen.ToString();
}

} // namespace docpatch
