#pragma once

#include <string>

// Bounds accepted for the timing options
constexpr int MIN_RETRY_DELAY_MS = 100;
constexpr int MAX_RETRY_DELAY_MS = 10 * 60 * 1000;
constexpr int MIN_PROGRESS_INTERVAL_MS = 1;
constexpr int MAX_PROGRESS_INTERVAL_MS = 1000; // Progress is refreshed at least once per second

/**
 * Configuration for the downloader.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct DownloadConfig
{
    // Either a direct URL...
    std::string url;

    // ...or an Audible customer id and product SKU to build one from
    std::string customerId;
    std::string sku;

    std::string output; // Empty: derived from SKU or URL

    std::string userAgent = "Audible ADM 6.6.0.19;Windows Vista  Build 9200";

    int retryDelayMs = 1000;       // Fixed delay between resume cycles
    int progressIntervalMs = 1000; // Progress display refresh
    int stallTimeoutSeconds = 0;   // 0 = no timeout on the body stream

    // Flags
    bool verbose = false;
    bool showVersion = false;
};

/**
 * URL to download: the configured URL, or the Audible download endpoint
 * for customerId/sku.
 *
 * @throws std::runtime_error if neither a URL nor both customer id and SKU are set
 */
std::string buildDownloadUrl(const DownloadConfig &config);

/**
 * Output path: the configured one, "<sku>.aax", or the last path segment of the URL.
 *
 * @throws std::runtime_error if no name can be derived
 */
std::string resolveOutputPath(const DownloadConfig &config);

/**
 * Check option values that the command line parser cannot express alone.
 *
 * @throws std::runtime_error naming the offending option
 */
void validateConfig(const DownloadConfig &config);
