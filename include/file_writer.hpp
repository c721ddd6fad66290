#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>

/**
 * Appends response body chunks to the output file.
 * The file is opened in append mode and never truncated, so bytes already
 * validated by earlier cycles are kept.
 */
class FileWriter
{
public:
    /**
     * Open (or create) the file for appending.
     * @throws DownloadError (LocalIo) if the file cannot be opened
     */
    explicit FileWriter(const std::filesystem::path &path);

    FileWriter(const FileWriter &) = delete;
    FileWriter &operator=(const FileWriter &) = delete;

    /**
     * Write the whole chunk and flush it to the file.
     * @return false if the write failed; the writer is unusable afterwards
     */
    bool append(const char *data, std::size_t size);

    /**
     * Flush and close. Safe to call more than once.
     * @throws DownloadError (LocalIo) if buffered data could not be written
     */
    void close();

    std::size_t bytesWritten() const { return bytesWritten_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    std::size_t bytesWritten_ = 0;
};
