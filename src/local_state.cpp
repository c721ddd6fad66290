#include "local_state.hpp"
#include "download_error.hpp"

#include <system_error>

#include <fmt/core.h>

std::uint64_t probeLocalOffset(const std::filesystem::path &outputPath)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(outputPath, ec);
    if (!ec)
    {
        return static_cast<std::uint64_t>(size);
    }

    // A missing file just means nothing has been downloaded yet
    if (ec == std::errc::no_such_file_or_directory)
    {
        return 0;
    }

    throw DownloadError(ErrorKind::LocalIo,
                        fmt::format("Cannot read size of {}: {}", outputPath.string(), ec.message()));
}

void ensureDirectoryExists(const std::filesystem::path &filePath)
{
    // Get the parent directory of the file
    auto directory = filePath.parent_path();

    // If parent directory is empty (file in current dir), nothing to create
    if (directory.empty())
    {
        return;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(directory, ec))
    {
        return;
    }

    // Create all parent directories (like mkdir -p)
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        throw DownloadError(ErrorKind::LocalIo,
                            fmt::format("Failed to create directory for {}: {}",
                                        filePath.string(), ec.message()));
    }
}
