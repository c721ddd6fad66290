#pragma once

#include <stdexcept>
#include <string>

/**
 * Categories of fatal download errors.
 * Transient failures never surface as a DownloadError; they are retried.
 */
enum class ErrorKind
{
    LocalIo,         // Output path could not be probed, opened or closed
    HttpStatus,      // Server answered with a status other than 206/416
    Protocol,        // Content-Range missing, malformed or inconsistent
    Request,         // Request failed before any response arrived
    RetriesExhausted // Retry policy gave up
};

/**
 * Fatal error raised by the download core.
 */
class DownloadError : public std::runtime_error
{
public:
    DownloadError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * Short lowercase name of an error kind, for log output.
 */
const char *errorKindName(ErrorKind kind);
