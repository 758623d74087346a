// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/core/config.hpp>
#include <fdm/core/progress.hpp>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

namespace fdm::cli {

// "0 B", "512 B", "1.50 KB", ... up to TB in 1024 steps
[[nodiscard]] std::string format_size(double bytes);
[[nodiscard]] std::string format_speed(double bytes_per_sec);
[[nodiscard]] std::string format_duration(std::chrono::steady_clock::duration elapsed);

// "[####------]" or the block-character variant on ANSI terminals
[[nodiscard]] std::string render_bar(double percent, int width, bool unicode);

// True when TERM is set
[[nodiscard]] bool terminal_supports_ansi() noexcept;

// Renders progress snapshots; the caller polls at interval()
class Presenter {
public:
    virtual ~Presenter() = default;

    virtual void render(const core::ProgressSnapshot& snapshot) = 0;

    // Last render once the job has ended
    virtual void finish(const core::ProgressSnapshot& snapshot) { render(snapshot); }

    [[nodiscard]] virtual std::chrono::milliseconds interval() const noexcept = 0;
};

// Rewrites the overall line and one line per fragment in place
class InlinePresenter final : public Presenter {
public:
    InlinePresenter(std::ostream& out, bool ansi) noexcept : out_(out), ansi_(ansi) {}

    void render(const core::ProgressSnapshot& snapshot) override;
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept override {
        return std::chrono::milliseconds(1000);
    }

private:
    std::ostream& out_;
    bool ansi_;
    std::size_t last_line_count_{0};
};

// Clears the screen and redraws a header, the totals and the fragment table
class FullScreenPresenter final : public Presenter {
public:
    explicit FullScreenPresenter(std::ostream& out) noexcept : out_(out) {}

    void render(const core::ProgressSnapshot& snapshot) override;
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept override {
        return std::chrono::milliseconds(500);
    }

private:
    std::ostream& out_;
};

// One line whenever overall progress moved by at least 5 points
class SimplePresenter final : public Presenter {
public:
    explicit SimplePresenter(std::ostream& out) noexcept : out_(out) {}

    void render(const core::ProgressSnapshot& snapshot) override;
    void finish(const core::ProgressSnapshot& snapshot) override;
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept override {
        return std::chrono::milliseconds(2000);
    }

private:
    void print_line(const core::ProgressSnapshot& snapshot);

    std::ostream& out_;
    double last_percent_{0.0};
};

// full_screen needs ANSI; without it the inline presenter is used
[[nodiscard]] std::unique_ptr<Presenter>
make_presenter(core::ProgressStyle style, std::ostream& out, bool ansi);

} // namespace fdm::cli
