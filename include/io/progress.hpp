// io/progress.hpp - console progress bar for experiment runs (indicators)
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>

#if !defined(_WIN32)
  #include <sys/ioctl.h>
  #include <unistd.h>
#endif

namespace io {

inline int get_terminal_width() {
#if !defined(_WIN32)
    if (const char* env = std::getenv("COLUMNS")) {
        int c = std::atoi(env); if (c > 0) return c;
    }
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) return (int)w.ws_col;
#endif
    return 80;
}

/**
 * Single bar on stderr; update() is expected to be called serialized (the
 * experiment runner holds a lock around its progress callback).
 */
class RunProgress {
public:
    explicit RunProgress(std::size_t total) {
        indicators::show_console_cursor(false);
        const int cols = get_terminal_width();
        const int barW = std::clamp(cols - 60, 10, 50);
        bar_ = std::make_unique<indicators::ProgressBar>(
            indicators::option::BarWidth{static_cast<std::size_t>(barW)},
            indicators::option::Start{"["},
            indicators::option::Fill{"="},
            indicators::option::Lead{">"},
            indicators::option::Remainder{" "},
            indicators::option::End{"]"},
            indicators::option::PrefixText{"runs "},
            indicators::option::ForegroundColor{indicators::Color::green},
            indicators::option::ShowElapsedTime{true},
            indicators::option::ShowRemainingTime{true},
            indicators::option::MaxProgress{total},
            indicators::option::Stream{std::cerr}
        );
    }

    ~RunProgress() { finish(); }

    RunProgress(const RunProgress&) = delete;
    RunProgress& operator=(const RunProgress&) = delete;

    void update(std::size_t done, std::size_t total) {
        if (!bar_) return;
        std::ostringstream oss;
        oss << done << "/" << total;
        bar_->set_option(indicators::option::PostfixText{oss.str()});
        bar_->set_progress(done);
    }

    void finish() {
        if (!bar_) return;
        if (!bar_->is_completed()) bar_->mark_as_completed();
        bar_.reset();
        indicators::show_console_cursor(true);
    }

private:
    std::unique_ptr<indicators::ProgressBar> bar_;
};

} // namespace io
