#include "progress.hpp"

#include <exception>

#include <fmt/core.h>

void ProgressState::setInitiating(const std::string &message)
{
    {
        std::lock_guard<std::mutex> lock(messageMutex_);
        message_ = message;
    }
    downloading_.store(false, std::memory_order_release);
}

void ProgressState::beginTransfer(std::uint64_t length, std::uint64_t position)
{
    length_.store(length, std::memory_order_relaxed);
    position_.store(position, std::memory_order_relaxed);
    cycle_.fetch_add(1, std::memory_order_relaxed);
    downloading_.store(true, std::memory_order_release);
}

void ProgressState::advance(std::uint64_t bytes)
{
    position_.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressState::finish()
{
    finished_.store(true, std::memory_order_release);
}

ProgressSnapshot ProgressState::snapshot() const
{
    ProgressSnapshot snap;
    snap.finished = finished_.load(std::memory_order_acquire);
    snap.downloading = downloading_.load(std::memory_order_acquire);
    snap.cycle = cycle_.load(std::memory_order_relaxed);
    snap.length = length_.load(std::memory_order_relaxed);
    snap.position = position_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(messageMutex_);
        snap.message = message_;
    }
    return snap;
}

ProgressReporter::ProgressReporter(const ProgressState &state, ProgressSink &sink,
                                   std::chrono::milliseconds interval)
    : state_(state), sink_(sink), interval_(interval)
{
}

ProgressReporter::~ProgressReporter()
{
    stop();
}

void ProgressReporter::start()
{
    if (thread_.joinable())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = false;
    }
    thread_ = std::thread([this]() { run(); });
}

void ProgressReporter::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable())
    {
        thread_.join();
    }
}

void ProgressReporter::run()
{
    bool healthy = true;
    while (healthy && !state_.isFinished())
    {
        healthy = tick();

        std::unique_lock<std::mutex> lock(mutex_);
        if (wake_.wait_for(lock, interval_, [this]() { return stopRequested_; }))
        {
            break;
        }
    }

    // Final redraw so the display ends on the last position
    if (healthy)
    {
        tick();
    }
}

bool ProgressReporter::tick()
{
    try
    {
        sink_.onTick(state_.snapshot());
        ++ticks_;
        return true;
    }
    catch (const std::exception &e)
    {
        // The display is not part of the transfer; stop drawing and let it run on
        fmt::print(stderr, "Warning: progress display disabled: {}\n", e.what());
        return false;
    }
}
