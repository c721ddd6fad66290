#pragma once

#include <cstdint>
#include <filesystem>

/**
 * Number of bytes of the output file already on disk.
 *
 * @param outputPath File being downloaded
 * @return Current file size, or 0 if the file does not exist
 * @throws DownloadError (LocalIo) for any other filesystem error
 */
std::uint64_t probeLocalOffset(const std::filesystem::path &outputPath);

/**
 * Ensure the directory for a file path exists, creating it if needed.
 *
 * @throws DownloadError (LocalIo) if the directory cannot be created
 */
void ensureDirectoryExists(const std::filesystem::path &filePath);
