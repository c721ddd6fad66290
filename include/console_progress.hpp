#pragma once

#include "progress.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

/**
 * Terminal progress display.
 * On a terminal a single line is redrawn in place; when output is piped,
 * one line is printed per tick.
 */
class ConsoleProgress : public ProgressSink
{
public:
    explicit ConsoleProgress(std::FILE *out = stdout);

    void onTick(const ProgressSnapshot &snapshot) override;
    void onMessage(const std::string &line) override;
    void onComplete(const std::string &outputPath) override;

    /**
     * End the redrawn line so that following output starts on a fresh line.
     * Further ticks are ignored.
     */
    void close();

    /**
     * Format bytes into human-readable string (e.g., "52.30 MB")
     */
    static std::string formatBytes(std::uint64_t bytes);

    /**
     * Format duration into human-readable string (e.g., "2m 30s")
     */
    static std::string formatDuration(long seconds);

    /**
     * Format elapsed time as HH:MM:SS.
     */
    static std::string formatElapsed(long seconds);

    /**
     * Render one progress line without terminal control codes.
     *
     * @param snapshot Current progress
     * @param elapsedSeconds Time since the display was created
     * @param bytesPerSecond Current cycle's transfer rate (0 if unknown)
     */
    static std::string renderLine(const ProgressSnapshot &snapshot, long elapsedSeconds, double bytesPerSecond);

private:
    void clearLine();
    void closeLocked();

    std::FILE *out_;
    bool isTerminalOutput_;
    std::mutex mutex_;

    std::chrono::steady_clock::time_point startTime_;

    // Rate is measured from the start of the current cycle
    std::uint64_t rateCycle_ = 0;
    std::uint64_t ratePosition_ = 0;
    std::chrono::steady_clock::time_point rateStart_;

    bool lineDrawn_ = false;
    bool closed_ = false;
};
