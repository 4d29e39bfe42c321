#include "console_dispatcher.hpp"
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>
#include <ftxui/screen/string.hpp>
#include <algorithm>
#include <cstdint>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace watchlogs {

namespace {

std::string expand_tabs(const std::string& line) {
    if (line.find('\t') == std::string::npos) return line;
    std::string out;
    out.reserve(line.size() + 8);
    for (char c : line) {
        if (c == '\t') {
            out.append(4, ' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

ConsoleDispatcher::ConsoleDispatcher(std::ostream& out, const std::vector<std::string>& paths,
                                     bool use_color)
    : out_(out)
    , use_color_(use_color)
{
    auto colors = make_palette(paths.size());
    for (std::size_t i = 0; i < paths.size(); ++i) {
        palette_[paths[i]] = colors[i];
    }
}

void ConsoleDispatcher::attach(OutputChannel& channel) {
    channel.subscribe([this](const LineEvent& event) {
        on_line(event);
    });
    channel.subscribe_idle([this](const IdleReport& report) {
        on_idle(report);
    });
}

std::vector<ftxui::Color> ConsoleDispatcher::make_palette(std::size_t count) {
    std::vector<ftxui::Color> colors;
    colors.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto hue = static_cast<uint8_t>((i * 256) / std::max<std::size_t>(count, 1));
        colors.push_back(ftxui::Color::HSV(hue, 190, 240));
    }
    return colors;
}

ftxui::Color ConsoleDispatcher::color_for(const std::string& path) const {
    auto it = palette_.find(path);
    if (it == palette_.end()) {
        return ftxui::Color::White;
    }
    return it->second;
}

std::string ConsoleDispatcher::format_duration(double seconds) {
    auto total = static_cast<int64_t>(std::floor(std::max(seconds, 0.0)));
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto secs = total % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setw(2) << std::setfill('0') << minutes << "m";
    } else if (minutes > 0) {
        ss << minutes << "m " << std::setw(2) << std::setfill('0') << secs << "s";
    } else {
        ss << secs << "s";
    }
    return ss.str();
}

std::string ConsoleDispatcher::format_line(const LineEvent& event) const {
    switch (event.kind) {
        case EventKind::Line:
            return event.path + " >>> " + event.text;
        case EventKind::Backfill: {
            std::string summary = event.path + " >>> " + event.text;
            if (event.note) {
                summary = "[stale log] (" + *event.note + "): " + summary;
            }
            return summary;
        }
        case EventKind::Truncated:
        case EventKind::Rotated:
            return event.path + " --- " + event.note.value_or(event_kind_to_string(event.kind));
        case EventKind::Missing:
            return event.path + " !!! " + event.note.value_or("file missing");
        default:
            return event.path + " >>> " + event.text;
    }
}

std::string ConsoleDispatcher::format_idle(const IdleReport& report) const {
    std::string summary = report.path + " ... idle for " + format_duration(report.idle_seconds());
    if (!report.last_line.empty()) {
        summary += " (last: " + report.last_line + ")";
    }
    return summary;
}

void ConsoleDispatcher::on_line(const LineEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    print(format_line(event), color_for(event.path), event.is_notice());
}

void ConsoleDispatcher::on_idle(const IdleReport& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    print(format_idle(report), color_for(report.path), true);
}

void ConsoleDispatcher::log_diagnostic(const std::string& component, const std::string& message,
                                       bool is_error) {
    std::lock_guard<std::mutex> lock(mutex_);
    print("[" + component + "] " + message,
          is_error ? ftxui::Color::Red : ftxui::Color::GrayLight, !is_error);
}

TailLog::Sink ConsoleDispatcher::get_log_sink() {
    return [this](const std::string& component, const std::string& msg, bool err) {
        this->log_diagnostic(component, msg, err);
    };
}

void ConsoleDispatcher::print(const std::string& line, ftxui::Color fg, bool dimmed) {
    if (!use_color_) {
        out_ << line << std::endl;
        return;
    }

    using namespace ftxui;
    std::string expanded = expand_tabs(line);
    auto element = text(expanded) | color(fg);
    if (dimmed) {
        element = element | dim;
    }

    auto screen = Screen::Create(Dimension::Fixed(std::max(1, string_width(expanded))),
                                 Dimension::Fixed(1));
    Render(screen, element);
    out_ << screen.ToString() << std::endl;
}

} // namespace watchlogs
