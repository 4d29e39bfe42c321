#pragma once

#include "line_event.hpp"
#include "output_channel.hpp"
#include "tail_log.hpp"
#include <ftxui/screen/color.hpp>
#include <map>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace watchlogs {

// Renders followed lines to a terminal, one color per file.
// Also takes over TailLog output so diagnostics never split a line.
class ConsoleDispatcher {
public:
    ConsoleDispatcher(std::ostream& out, const std::vector<std::string>& paths,
                      bool use_color = true);

    // Subscribe to lines and idle reports
    void attach(OutputChannel& channel);

    void on_line(const LineEvent& event);
    void on_idle(const IdleReport& report);
    void log_diagnostic(const std::string& component, const std::string& message,
                        bool is_error = false);

    TailLog::Sink get_log_sink();

    // Plain text, without color
    std::string format_line(const LineEvent& event) const;
    std::string format_idle(const IdleReport& report) const;

    ftxui::Color color_for(const std::string& path) const;

    // Evenly spaced hues, one per watched file
    static std::vector<ftxui::Color> make_palette(std::size_t count);

    // "42s", "3m 05s", "2h 10m"
    static std::string format_duration(double seconds);

private:
    void print(const std::string& line, ftxui::Color fg, bool dimmed = false);

    std::ostream& out_;
    bool use_color_;
    std::map<std::string, ftxui::Color> palette_;
    std::mutex mutex_;
};

} // namespace watchlogs
