#pragma once

#include "download_error.hpp"
#include "http_transport.hpp"
#include "progress.hpp"
#include "retry_policy.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

/**
 * What to download and where to put it. Immutable for a whole run.
 */
struct DownloadTarget
{
    std::string url;
    std::filesystem::path outputPath;
};

/**
 * Terminal result of a run: Completed(outputPath) or Failed(error).
 */
struct DownloadOutcome
{
    enum class Status
    {
        Completed,
        Failed
    };

    Status status = Status::Completed;
    std::filesystem::path outputPath;
    ErrorKind errorKind = ErrorKind::LocalIo; // Only meaningful when Failed
    std::string error;
    int retries = 0;

    bool ok() const { return status == Status::Completed; }
};

/**
 * Resumable download of a single file.
 *
 * Each cycle probes the bytes already on disk, requests the rest with a
 * Range header, validates the server's Content-Range, and appends the body
 * to the file. A failure while the body is streaming closes the file and
 * starts a new cycle after the retry policy's delay. Everything else is
 * either a success (206 streamed to the end, or 416) or a fatal error.
 */
class ResumeDownloader
{
public:
    enum class State
    {
        Init,
        Requesting,
        Downloading,
        Retrying,
        Completed,
        Failed
    };

    ResumeDownloader(DownloadTarget target,
                     HttpTransport &transport,
                     const RetryPolicy &retryPolicy,
                     ProgressState &progress,
                     ProgressSink &sink,
                     bool verbose = false);

    /**
     * Run cycles until a terminal outcome is reached.
     * Always marks the progress state finished before returning.
     */
    DownloadOutcome run();

    State state() const { return state_; }

private:
    enum class CycleResult
    {
        Completed,
        Transient
    };

    /**
     * One request/stream cycle from the given offset.
     * @throws DownloadError on fatal conditions
     */
    CycleResult runCycle(std::uint64_t offset);

    void log(const std::string &line);

    DownloadTarget target_;
    HttpTransport &transport_;
    const RetryPolicy &retryPolicy_;
    ProgressState &progress_;
    ProgressSink &sink_;
    bool verbose_;

    State state_ = State::Init;
    std::string lastTransientError_;
};
