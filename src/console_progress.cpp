#include "console_progress.hpp"

#include <unistd.h>

#include <fmt/core.h>

ConsoleProgress::ConsoleProgress(std::FILE *out)
    : out_(out),
      startTime_(std::chrono::steady_clock::now()),
      rateStart_(startTime_)
{
    // Detect if output is a terminal to decide how we render the progress bar
    isTerminalOutput_ = ::isatty(fileno(out_));
}

void ConsoleProgress::onTick(const ProgressSnapshot &snapshot)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
    {
        return;
    }

    auto now = std::chrono::steady_clock::now();

    // A new cycle resumes from the probed offset: restart speed and ETA from there
    if (snapshot.cycle != rateCycle_)
    {
        rateCycle_ = snapshot.cycle;
        ratePosition_ = snapshot.position;
        rateStart_ = now;
    }

    double speed = 0.0;
    auto rateElapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - rateStart_).count();
    if (snapshot.downloading && rateElapsedMs > 0 && snapshot.position >= ratePosition_)
    {
        speed = static_cast<double>(snapshot.position - ratePosition_) * 1000.0 / static_cast<double>(rateElapsedMs);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();
    std::string line = renderLine(snapshot, static_cast<long>(elapsed), speed);

    if (isTerminalOutput_)
    {
        fmt::print(out_, "\r{}\033[K", line);
        lineDrawn_ = true;
    }
    else
    {
        fmt::print(out_, "{}\n", line);
    }
    std::fflush(out_);
}

void ConsoleProgress::onMessage(const std::string &line)
{
    std::lock_guard<std::mutex> lock(mutex_);
    clearLine();
    fmt::print(out_, "{}\n", line);
    std::fflush(out_);
}

void ConsoleProgress::onComplete(const std::string &outputPath)
{
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
    fmt::print(stderr, "Download complete: {}\n", outputPath);
}

void ConsoleProgress::close()
{
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

void ConsoleProgress::closeLocked()
{
    if (lineDrawn_)
    {
        // Keep the final bar on screen
        fmt::print(out_, "\n");
        lineDrawn_ = false;
    }
    std::fflush(out_);
    closed_ = true;
}

void ConsoleProgress::clearLine()
{
    if (lineDrawn_)
    {
        fmt::print(out_, "\r\033[K");
        lineDrawn_ = false;
    }
}

std::string ConsoleProgress::renderLine(const ProgressSnapshot &snapshot, long elapsedSeconds, double bytesPerSecond)
{
    constexpr int barWidth = 35;

    double ratio = 0.0;
    if (snapshot.downloading && snapshot.length > 0)
    {
        ratio = static_cast<double>(snapshot.position) / static_cast<double>(snapshot.length);
        if (ratio > 1.0)
        {
            ratio = 1.0;
        }
    }

    int filled = static_cast<int>(ratio * barWidth);
    std::string bar;
    bar.reserve(barWidth);
    for (int i = 0; i < barWidth; ++i)
    {
        if (i < filled)
        {
            bar += "#";
        }
        else if (i == filled && snapshot.downloading)
        {
            bar += ">";
        }
        else
        {
            bar += "-";
        }
    }

    if (!snapshot.downloading)
    {
        return fmt::format("[{}] [{}] {}", formatElapsed(elapsedSeconds), bar, snapshot.message);
    }

    // Format speed (KB/s or MB/s)
    std::string speedStr;
    if (bytesPerSecond >= 1024 * 1024)
    {
        speedStr = fmt::format("{:.2f} MB/s", bytesPerSecond / (1024.0 * 1024.0));
    }
    else if (bytesPerSecond >= 1024)
    {
        speedStr = fmt::format("{:.2f} KB/s", bytesPerSecond / 1024.0);
    }
    else
    {
        speedStr = fmt::format("{:.0f} B/s", bytesPerSecond);
    }

    std::string eta = "unknown";
    if (bytesPerSecond > 0 && snapshot.length >= snapshot.position)
    {
        eta = formatDuration(static_cast<long>(static_cast<double>(snapshot.length - snapshot.position) / bytesPerSecond));
    }

    return fmt::format("[{}] [{}] {}/{} | {} | ETA: {}",
                       formatElapsed(elapsedSeconds),
                       bar,
                       formatBytes(snapshot.position),
                       formatBytes(snapshot.length),
                       speedStr,
                       eta);
}

// Format bytes into human-readable string
std::string ConsoleProgress::formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (value >= GB)
    {
        return fmt::format("{:.2f} GB", value / GB);
    }
    else if (value >= MB)
    {
        return fmt::format("{:.2f} MB", value / MB);
    }
    else if (value >= KB)
    {
        return fmt::format("{:.2f} KB", value / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

// Format duration into human-readable string
std::string ConsoleProgress::formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        long minutes = seconds / 60;
        long secs = seconds % 60;
        return fmt::format("{}m {}s", minutes, secs);
    }
    else
    {
        long hours = seconds / 3600;
        long minutes = (seconds % 3600) / 60;
        return fmt::format("{}h {}m", hours, minutes);
    }
}

std::string ConsoleProgress::formatElapsed(long seconds)
{
    if (seconds < 0)
    {
        seconds = 0;
    }
    return fmt::format("{:02}:{:02}:{:02}", seconds / 3600, (seconds % 3600) / 60, seconds % 60);
}
