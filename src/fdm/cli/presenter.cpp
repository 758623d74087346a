// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/cli/presenter.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iterator>
#include <ostream>
#include <string_view>
#include <vector>

namespace fdm::cli {

namespace {

constexpr std::string_view SIZE_UNITS[] = {"B", "KB", "MB", "GB", "TB"};

std::string total_or_unknown(const std::optional<std::uint64_t>& total) {
    return total ? format_size(static_cast<double>(*total)) : std::string("?");
}

std::string fragment_speed(double speed) {
    return speed > 0.0 ? format_speed(speed) : std::string("0 B/s");
}

} // namespace

//=============================================================================
// Formatting
//=============================================================================

std::string format_size(double bytes) {
    if (bytes <= 0.0) return "0 B";

    std::size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < std::size(SIZE_UNITS)) {
        bytes /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return fmt::format("{:.0f} B", bytes);
    }
    return fmt::format("{:.2f} {}", bytes, SIZE_UNITS[unit]);
}

std::string format_speed(double bytes_per_sec) {
    return format_size(bytes_per_sec) + "/s";
}

std::string format_duration(std::chrono::steady_clock::duration elapsed) {
    auto total = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (total < 0) total = 0;

    const auto hours = total / 3'600'000;
    const auto minutes = (total % 3'600'000) / 60'000;
    const double seconds = static_cast<double>(total % 60'000) / 1000.0;

    if (hours > 0) {
        return fmt::format("{}h {:02}m {:.0f}s", hours, minutes, std::floor(seconds));
    }
    if (minutes > 0) {
        return fmt::format("{}m {:.0f}s", minutes, std::floor(seconds));
    }
    return fmt::format("{:.2f}s", seconds);
}

std::string render_bar(double percent, int width, bool unicode) {
    percent = std::clamp(percent, 0.0, 100.0);
    const int filled = static_cast<int>(width * percent / 100.0);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        if (unicode) {
            bar += i < filled ? "█" : "░";
        } else {
            bar += i < filled ? '#' : '-';
        }
    }
    bar += "]";
    return bar;
}

bool terminal_supports_ansi() noexcept {
    return std::getenv("TERM") != nullptr;
}

//=============================================================================
// InlinePresenter
//=============================================================================

void InlinePresenter::render(const core::ProgressSnapshot& snapshot) {
    std::vector<std::string> lines;
    lines.reserve(snapshot.fragments.size() + 1);

    lines.push_back(fmt::format("Overall: {} {:5.1f}% | {}/{}",
                                render_bar(snapshot.percent, 30, ansi_), snapshot.percent,
                                format_size(static_cast<double>(snapshot.bytes_downloaded)),
                                total_or_unknown(snapshot.bytes_total)));

    for (const auto& fragment : snapshot.fragments) {
        lines.push_back(fmt::format("Frag {:2d}: {} {:5.1f}% | {:>10}",
                                    fragment.index + 1, render_bar(fragment.percent, 20, ansi_),
                                    fragment.percent, fragment_speed(fragment.speed)));
    }

    // Move back over the previous frame and drop it; the new one may be shorter
    if (ansi_ && last_line_count_ > 0) {
        out_ << "\033[" << last_line_count_ << "A\033[J";
    }

    for (const auto& line : lines) {
        if (ansi_) {
            out_ << "\033[K" << line << '\n';
        } else {
            out_ << fmt::format("{:<80}", line) << '\n';
        }
    }
    if (!ansi_) {
        out_ << std::string(50, '-') << '\n';
    }
    out_.flush();

    last_line_count_ = lines.size();
}

//=============================================================================
// FullScreenPresenter
//=============================================================================

void FullScreenPresenter::render(const core::ProgressSnapshot& snapshot) {
    const std::string rule(60, '=');

    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    std::string frame = "\033[2J\033[H";
    frame += rule + '\n';
    frame += fmt::format("DOWNLOAD PROGRESS - {:%H:%M:%S}\n", local);
    frame += rule + '\n';

    frame += fmt::format("Overall: {} {:.1f}%\n", render_bar(snapshot.percent, 30, true), snapshot.percent);
    frame += fmt::format("Downloaded: {} / {}\n",
                         format_size(static_cast<double>(snapshot.bytes_downloaded)),
                         total_or_unknown(snapshot.bytes_total));
    frame += fmt::format("Total Speed: {}\n", format_speed(snapshot.speed));
    frame += fmt::format("Elapsed: {}\n\n", format_duration(snapshot.elapsed));

    frame += "Fragment Progress:\n";
    frame += std::string(60, '-') + '\n';
    for (const auto& fragment : snapshot.fragments) {
        const bool done = fragment.state == core::FragmentState::completed;
        frame += fmt::format("{} Fragment {:2d}: {} {:5.1f}% | {:>10}\n",
                             done ? "✓" : "↓", fragment.index + 1,
                             render_bar(fragment.percent, 30, true), fragment.percent,
                             fragment_speed(fragment.speed));
    }
    frame += rule + '\n';

    out_ << frame << std::flush;
}

//=============================================================================
// SimplePresenter
//=============================================================================

void SimplePresenter::print_line(const core::ProgressSnapshot& snapshot) {
    out_ << fmt::format("Progress: {:5.1f}% | Speed: {} | Fragments: {}/{} completed",
                        snapshot.percent, format_speed(snapshot.speed),
                        snapshot.completed_fragments, snapshot.fragments.size())
         << std::endl;
    last_percent_ = snapshot.percent;
}

void SimplePresenter::render(const core::ProgressSnapshot& snapshot) {
    if (std::abs(snapshot.percent - last_percent_) >= 5.0) {
        print_line(snapshot);
    }
}

void SimplePresenter::finish(const core::ProgressSnapshot& snapshot) {
    if (snapshot.percent != last_percent_) {
        print_line(snapshot);
    }
}

std::unique_ptr<Presenter> make_presenter(core::ProgressStyle style, std::ostream& out, bool ansi) {
    switch (style) {
        case core::ProgressStyle::simple:
            return std::make_unique<SimplePresenter>(out);
        case core::ProgressStyle::full_screen:
            if (ansi) return std::make_unique<FullScreenPresenter>(out);
            break;
        case core::ProgressStyle::inline_:
            break;
    }
    return std::make_unique<InlinePresenter>(out, ansi);
}

} // namespace fdm::cli
