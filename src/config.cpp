#include "config.hpp"

#include <stdexcept>

#include <fmt/core.h>

std::string buildDownloadUrl(const DownloadConfig &config)
{
    if (!config.url.empty())
    {
        return config.url;
    }

    if (config.customerId.empty() || config.sku.empty())
    {
        throw std::runtime_error("Either --url or both --customer-id and SKU are required");
    }

    return fmt::format(
        "https://cds.audible.com/download?user_id={}&product_id={}&codec=LC_128_44100_Stereo&awtype=AAX&cust_id={}",
        config.customerId,
        config.sku,
        config.customerId);
}

std::string resolveOutputPath(const DownloadConfig &config)
{
    if (!config.output.empty())
    {
        return config.output;
    }

    if (!config.sku.empty())
    {
        return fmt::format("{}.aax", config.sku);
    }

    // Last path segment of the URL, without query or fragment
    std::string path = config.url;
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos)
    {
        path.erase(cut);
    }
    auto scheme = path.find("://");
    if (scheme != std::string::npos)
    {
        path.erase(0, scheme + 3);
    }
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? std::string() : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..")
    {
        throw std::runtime_error(fmt::format("Cannot derive an output file name from {}; use --output", config.url));
    }
    return name;
}

void validateConfig(const DownloadConfig &config)
{
    if (config.retryDelayMs < MIN_RETRY_DELAY_MS || config.retryDelayMs > MAX_RETRY_DELAY_MS)
    {
        throw std::runtime_error(fmt::format("--retry-delay must be between {} and {} ms",
                                             MIN_RETRY_DELAY_MS, MAX_RETRY_DELAY_MS));
    }
    if (config.progressIntervalMs < MIN_PROGRESS_INTERVAL_MS || config.progressIntervalMs > MAX_PROGRESS_INTERVAL_MS)
    {
        throw std::runtime_error(fmt::format("--progress-interval must be between {} and {} ms",
                                             MIN_PROGRESS_INTERVAL_MS, MAX_PROGRESS_INTERVAL_MS));
    }
    if (config.stallTimeoutSeconds < 0)
    {
        throw std::runtime_error("--stall-timeout must not be negative");
    }
}
