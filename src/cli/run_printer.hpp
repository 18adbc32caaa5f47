#pragma once

#include <iostream>
#include <string>
#include <sync/sync_event.hpp>

// Renders run events on the terminal.
//
// Foreground runs redraw one progress bar in place and print status lines
// above it. Background runs (REPL) print only milestones, so the prompt
// is not buried under the copy tool's per-file chatter.
class RunPrinter {
public:
    explicit RunPrinter(bool background, bool verbose = false, std::ostream& out = std::cout)
        : background_(background), verbose_(verbose), out_(&out) {}

    void set_output(std::ostream& out) { out_ = &out; }

    // Forget the last run's state before the next one starts.
    void reset();

    void print(const SyncEvent& event);

    // Terminate a visible progress bar line.
    void finish();

private:
    void clear_bar();
    void draw_bar();

    bool background_;
    bool verbose_;
    std::ostream* out_;
    bool bar_visible_ = false;
    int percent_ = 0;
    int last_reported_ = -1;
    std::string label_;
};
