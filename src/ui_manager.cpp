#include "ui_manager.hpp"
#include "utils/logger.hpp"
#include "utils/colors.hpp"
#include "utils/text.hpp"
#include <format>
#include <stdexcept>

namespace gpudash::tui {

UIManager::UIManager() {
}

UIManager::~UIManager() {
    shutdown();
}

void UIManager::init(const TerminalDevice& device) {
    if (initialized_) return;

    session_ = std::make_unique<TerminalSession>(device);

    // Calculate layout
    layout_.calculate(session_->width(), session_->height());

    // Create windows
    create_windows();

    initialized_ = true;
    LOG_INFO("UIManager", std::format("Initialized ({}x{})",
             layout_.term_width, layout_.term_height));
}

void UIManager::shutdown() {
    if (!session_) return;

    destroy_windows();
    session_.reset();

    initialized_ = false;
    LOG_INFO("UIManager", "Shut down");
}

void UIManager::create_windows() {
    destroy_windows();

    const auto& l = layout_;

    // newwin() treats a zero size as "to the edge of the screen", so skip empty regions
    if (l.header.height > 0 && l.term_width > 0) {
        header_win_ = newwin(l.header.height, l.term_width, l.header.y, 0);
    }
    if (l.body.height > 0 && l.term_width > 0) {
        body_win_ = newwin(l.body.height, l.term_width, l.body.y, 0);
    }
    if (l.footer.height > 0 && l.term_width > 0) {
        footer_win_ = newwin(l.footer.height, l.term_width, l.footer.y, 0);
    }

    telemetry_panel_.set_layout(layout_);

    LOG_DEBUG("UIManager", "Windows created");
}

void UIManager::destroy_windows() {
    if (header_win_) { delwin(header_win_); header_win_ = nullptr; }
    if (body_win_) { delwin(body_win_); body_win_ = nullptr; }
    if (footer_win_) { delwin(footer_win_); footer_win_ = nullptr; }
}

void UIManager::update_layout() {
    if (!session_) return;

    int h = session_->height();
    int w = session_->width();

    if (h != layout_.term_height || w != layout_.term_width) {
        layout_.calculate(w, h);
        // Resized windows leave stale cells on stdscr otherwise
        clear();
        wnoutrefresh(stdscr);
        create_windows();
        LOG_INFO("UIManager", std::format("Layout updated ({}x{})", w, h));
    }
}

void UIManager::draw(const Frame& frame) {
    if (!initialized_) {
        throw std::runtime_error("Cannot draw before the terminal is initialized");
    }

    render_header(frame.header);
    render_body(frame.body);
    render_footer(frame.footer);

    if (doupdate() == ERR) {
        throw std::runtime_error("Failed to draw frame");
    }
}

void UIManager::render_header(const HeaderBlock& header) {
    if (!header_win_) return;

    werase(header_win_);
    int width = layout_.term_width;

    // Title row
    wattron(header_win_, COLOR_PAIR(colors::HEADER));
    mvwhline(header_win_, 0, 0, ' ', width);
    wattron(header_win_, A_BOLD);
    mvwaddstr(header_win_, 0, 2, clip_to_width(header.title, width - 2).c_str());
    wattroff(header_win_, A_BOLD);
    wattroff(header_win_, COLOR_PAIR(colors::HEADER));

    if (layout_.header.height > 1) {
        wattron(header_win_, COLOR_PAIR(colors::TEXT_DIM));
        mvwaddstr(header_win_, 1, 2, clip_to_width(header.instructions, width - 2).c_str());
        wattroff(header_win_, COLOR_PAIR(colors::TEXT_DIM));
    }

    // Separator
    if (layout_.header.height > 2) {
        wattron(header_win_, COLOR_PAIR(colors::BORDER));
        mvwhline(header_win_, 2, 0, ACS_HLINE, width);
        wattroff(header_win_, COLOR_PAIR(colors::BORDER));
    }

    wnoutrefresh(header_win_);
}

void UIManager::render_body(const BodyBlock& body) {
    if (!body_win_) return;

    telemetry_panel_.set_content(body);
    telemetry_panel_.render(body_win_);
    wnoutrefresh(body_win_);
}

void UIManager::render_footer(const FooterBlock& footer) {
    if (!footer_win_) return;

    werase(footer_win_);
    int width = layout_.term_width;

    if (layout_.footer.height >= 3) {
        wattron(footer_win_, COLOR_PAIR(colors::BORDER));
        box(footer_win_, 0, 0);
        wattroff(footer_win_, COLOR_PAIR(colors::BORDER));
    }

    int row = layout_.footer.height >= 3 ? 1 : 0;
    wattron(footer_win_, COLOR_PAIR(colors::FOOTER));
    mvwaddstr(footer_win_, row, 2, clip_to_width(footer.text, width - 4).c_str());
    wattroff(footer_win_, COLOR_PAIR(colors::FOOTER));

    wnoutrefresh(footer_win_);
}

InputEvent UIManager::poll_input(int timeout_ms) {
    if (!initialized_) {
        throw std::runtime_error("Cannot read input before the terminal is initialized");
    }

    timeout(timeout_ms);
    return classify_input(getch());
}

} // namespace gpudash::tui
