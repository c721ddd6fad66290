#include "resume_downloader.hpp"
#include "content_range.hpp"
#include "file_writer.hpp"
#include "local_state.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

#include <fmt/core.h>

namespace
{

constexpr long HTTP_PARTIAL_CONTENT = 206;
constexpr long HTTP_RANGE_NOT_SATISFIABLE = 416;

/**
 * Handles one response: classifies the status, validates Content-Range,
 * then appends the body. Nothing may throw through the transport's
 * callbacks, so fatal errors are kept and rethrown once fetch() returns.
 */
class CycleHandler : public ResponseHandler
{
public:
    CycleHandler(const std::filesystem::path &outputPath, std::uint64_t offset, ProgressState &progress)
        : outputPath_(outputPath), offset_(offset), progress_(progress)
    {
    }

    bool onHead(const ResponseHead &head) override
    {
        headSeen_ = true;

        if (head.status == HTTP_RANGE_NOT_SATISFIABLE)
        {
            // Offset is already at the remote size
            alreadyComplete_ = true;
            return false;
        }
        if (head.status != HTTP_PARTIAL_CONTENT)
        {
            fatal_.emplace(ErrorKind::HttpStatus,
                           fmt::format("Invalid status code: {} {}", head.status,
                                       getHttpStatusText(head.status)));
            return false;
        }

        if (!head.contentRange)
        {
            return reject(ContentRangeError::Missing, "");
        }
        auto parsed = parseContentRange(*head.contentRange);
        if (auto *error = std::get_if<ContentRangeError>(&parsed))
        {
            return reject(*error, *head.contentRange);
        }
        const auto &range = std::get<ContentRange>(parsed);
        if (auto error = checkContentRange(range, offset_))
        {
            return reject(*error, *head.contentRange);
        }

        try
        {
            writer_ = std::make_unique<FileWriter>(outputPath_);
        }
        catch (const DownloadError &e)
        {
            fatal_ = e;
            return false;
        }

        progress_.beginTransfer(range.total, offset_);
        return true;
    }

    bool onChunk(const char *data, std::size_t size) override
    {
        if (!writer_->append(data, size))
        {
            writeFailed_ = true;
            return false;
        }
        progress_.advance(size);
        return true;
    }

    /**
     * Flush and close the output file; the next probe must see every byte.
     */
    void closeFile()
    {
        if (writer_)
        {
            writer_->close();
        }
    }

    bool headSeen() const { return headSeen_; }
    bool alreadyComplete() const { return alreadyComplete_; }
    bool writeFailed() const { return writeFailed_; }
    const std::optional<DownloadError> &fatal() const { return fatal_; }
    std::size_t bytesWritten() const { return writer_ ? writer_->bytesWritten() : 0; }

private:
    bool reject(ContentRangeError error, const std::string &header)
    {
        std::string message = describe(error);
        if (!header.empty())
        {
            message = fmt::format("{} (requested offset {}, got \"{}\")", message, offset_, header);
        }
        fatal_.emplace(ErrorKind::Protocol, message);
        return false;
    }

    const std::filesystem::path &outputPath_;
    std::uint64_t offset_;
    ProgressState &progress_;

    std::unique_ptr<FileWriter> writer_;
    std::optional<DownloadError> fatal_;
    bool headSeen_ = false;
    bool alreadyComplete_ = false;
    bool writeFailed_ = false;
};

} // namespace

ResumeDownloader::ResumeDownloader(DownloadTarget target,
                                   HttpTransport &transport,
                                   const RetryPolicy &retryPolicy,
                                   ProgressState &progress,
                                   ProgressSink &sink,
                                   bool verbose)
    : target_(std::move(target)),
      transport_(transport),
      retryPolicy_(retryPolicy),
      progress_(progress),
      sink_(sink),
      verbose_(verbose)
{
}

DownloadOutcome ResumeDownloader::run()
{
    DownloadOutcome outcome;
    outcome.outputPath = target_.outputPath;

    state_ = State::Init;
    progress_.setInitiating("Initiating download...");

    try
    {
        ensureDirectoryExists(target_.outputPath);

        while (true)
        {
            state_ = State::Requesting;

            // Always trust the disk, never the in-memory position
            const std::uint64_t offset = probeLocalOffset(target_.outputPath);
            if (verbose_)
            {
                log(fmt::format("Downloading from offset {}", offset));
            }

            if (runCycle(offset) == CycleResult::Completed)
            {
                break;
            }

            state_ = State::Retrying;
            auto delay = retryPolicy_.nextDelay(outcome.retries + 1);
            if (!delay)
            {
                throw DownloadError(ErrorKind::RetriesExhausted,
                                    fmt::format("Download failed after {} retries: {}",
                                                outcome.retries, lastTransientError_));
            }
            ++outcome.retries;

            progress_.setInitiating("Restarting download...");
            std::this_thread::sleep_for(*delay);
        }
    }
    catch (const DownloadError &e)
    {
        state_ = State::Failed;
        progress_.finish();
        outcome.status = DownloadOutcome::Status::Failed;
        outcome.errorKind = e.kind();
        outcome.error = e.what();
        return outcome;
    }

    state_ = State::Completed;
    progress_.finish();
    try
    {
        // Final redraw before the completion notice
        sink_.onTick(progress_.snapshot());
        sink_.onComplete(target_.outputPath.string());
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: progress display failed: {}\n", e.what());
        fmt::print(stderr, "Download complete: {}\n", target_.outputPath.string());
    }
    outcome.status = DownloadOutcome::Status::Completed;
    return outcome;
}

ResumeDownloader::CycleResult ResumeDownloader::runCycle(std::uint64_t offset)
{
    CycleHandler handler(target_.outputPath, offset, progress_);

    RangeRequest request{target_.url, offset};
    FetchResult result = transport_.fetch(request, handler);

    if (handler.headSeen() && !handler.fatal() && !handler.alreadyComplete())
    {
        state_ = State::Downloading;
    }

    // Close before deciding anything else so the bytes are durable
    handler.closeFile();

    if (handler.fatal())
    {
        throw *handler.fatal();
    }
    if (handler.alreadyComplete())
    {
        return CycleResult::Completed;
    }

    if (!handler.headSeen())
    {
        if (result.status == FetchResult::Status::Failed)
        {
            throw DownloadError(ErrorKind::Request, fmt::format("Request failed: {}", result.message));
        }
        throw DownloadError(ErrorKind::Request, "Request finished without a response");
    }

    if (handler.writeFailed())
    {
        lastTransientError_ = fmt::format("Cannot write to {}", target_.outputPath.string());
    }
    else if (result.status == FetchResult::Status::Failed)
    {
        lastTransientError_ = result.message;
    }
    else
    {
        // Body received to the end
        return CycleResult::Completed;
    }

    if (verbose_)
    {
        log(fmt::format("Error: {} ({} bytes written this attempt)", lastTransientError_, handler.bytesWritten()));
    }
    return CycleResult::Transient;
}

void ResumeDownloader::log(const std::string &line)
{
    try
    {
        sink_.onMessage(line);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "{} ({})\n", line, e.what());
    }
}
