#include "run_printer.hpp"
#include "theme.hpp"

// Background runs report progress in steps of this size
static constexpr int BACKGROUND_PROGRESS_STEP = 10;

void RunPrinter::clear_bar() {
    if (bar_visible_) {
        (*out_) << "\r\033[K";
        bar_visible_ = false;
    }
}

void RunPrinter::draw_bar() {
    (*out_) << theme::progress_bar(percent_, label_) << std::flush;
    bar_visible_ = true;
}

void RunPrinter::reset() {
    finish();
    percent_ = 0;
    last_reported_ = -1;
    label_.clear();
}

void RunPrinter::finish() {
    if (bar_visible_) {
        (*out_) << "\n";
        bar_visible_ = false;
    }
}

void RunPrinter::print(const SyncEvent& event) {
    if (background_) {
        switch (event.kind) {
            case EventKind::Progress:
                if (event.percent >= last_reported_ + BACKGROUND_PROGRESS_STEP) {
                    last_reported_ = event.percent;
                    (*out_) << theme::log(std::to_string(event.percent) + "%");
                }
                break;
            case EventKind::Error:    (*out_) << theme::fail(event.message); break;
            case EventKind::Complete: (*out_) << theme::ok(event.message); break;
            case EventKind::Done:     (*out_) << theme::info(event.message); break;
            case EventKind::Status:
                if (verbose_) (*out_) << theme::log(event.message);
                break;
        }
        return;
    }

    switch (event.kind) {
        case EventKind::Progress:
            percent_ = event.percent;
            if (!event.message.empty()) label_ = event.message;
            draw_bar();
            return;
        case EventKind::Status:
            clear_bar();
            (*out_) << theme::log(event.message);
            break;
        case EventKind::Error:
            clear_bar();
            (*out_) << theme::fail(event.message);
            break;
        case EventKind::Complete:
            clear_bar();
            (*out_) << theme::ok(event.message);
            break;
        case EventKind::Done:
            percent_ = 100;
            label_ = "done";
            draw_bar();
            finish();
            return;
    }
    if (percent_ > 0) draw_bar();
}
