#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

/**
 * Point-in-time copy of the transfer progress.
 */
struct ProgressSnapshot
{
    std::uint64_t position = 0;
    std::uint64_t length = 0;
    std::string message;
    bool downloading = false; // false while initiating or restarting
    bool finished = false;
    std::uint64_t cycle = 0; // Incremented each time a body starts streaming
};

/**
 * Progress shared between the transfer thread (writer) and the reporter
 * thread (reader). Counters are atomic; the message is mutex-guarded.
 */
class ProgressState
{
public:
    ProgressState() = default;

    ProgressState(const ProgressState &) = delete;
    ProgressState &operator=(const ProgressState &) = delete;

    /**
     * Switch to the initiating style with a message.
     * Position and length are kept.
     */
    void setInitiating(const std::string &message);

    /**
     * A validated body starts streaming at position out of length bytes.
     */
    void beginTransfer(std::uint64_t length, std::uint64_t position);

    void advance(std::uint64_t bytes);
    void finish();

    bool isFinished() const { return finished_.load(std::memory_order_acquire); }
    std::uint64_t position() const { return position_.load(std::memory_order_relaxed); }

    ProgressSnapshot snapshot() const;

private:
    std::atomic<std::uint64_t> position_{0};
    std::atomic<std::uint64_t> length_{0};
    std::atomic<std::uint64_t> cycle_{0};
    std::atomic<bool> downloading_{false};
    std::atomic<bool> finished_{false};

    mutable std::mutex messageMutex_;
    std::string message_;
};

/**
 * Receiver of progress events (the display).
 * onTick is called from the reporter thread, the others from the transfer
 * thread, so implementations must be thread-safe.
 */
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;

    virtual void onTick(const ProgressSnapshot &snapshot) = 0;
    virtual void onMessage(const std::string &line) = 0;
    virtual void onComplete(const std::string &outputPath) = 0;
};

/**
 * Periodically pushes snapshots of a ProgressState to a sink on its own
 * thread until the state is finished or stop() is called.
 */
class ProgressReporter
{
public:
    ProgressReporter(const ProgressState &state, ProgressSink &sink,
                     std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter &) = delete;
    ProgressReporter &operator=(const ProgressReporter &) = delete;

    void start();

    /**
     * Wake the thread, let it emit a final tick, and join it.
     */
    void stop();

    std::uint64_t tickCount() const { return ticks_.load(); }

private:
    void run();
    bool tick();

    const ProgressState &state_;
    ProgressSink &sink_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopRequested_ = false;
    std::atomic<std::uint64_t> ticks_{0};
};
