#include "file_writer.hpp"
#include "download_error.hpp"

#include <fmt/core.h>

FileWriter::FileWriter(const std::filesystem::path &path)
    : path_(path), out_(path, std::ios::binary | std::ios::app)
{
    if (!out_)
    {
        throw DownloadError(ErrorKind::LocalIo,
                            fmt::format("Cannot open file for writing: {}", path_.string()));
    }
}

bool FileWriter::append(const char *data, std::size_t size)
{
    out_.write(data, static_cast<std::streamsize>(size));
    // Flush per chunk so the file length always matches what was appended
    out_.flush();
    if (!out_.good())
    {
        return false;
    }
    bytesWritten_ += size;
    return true;
}

void FileWriter::close()
{
    if (!out_.is_open())
    {
        return;
    }
    const bool wasGood = out_.good();
    out_.close();
    // A stream that already failed mid-write is reported by append(), not here
    if (wasGood && out_.fail())
    {
        throw DownloadError(ErrorKind::LocalIo,
                            fmt::format("Cannot close file: {}", path_.string()));
    }
}
