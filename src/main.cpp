#include <chrono>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include "config.hpp"
#include "console_progress.hpp"
#include "http_client.hpp"
#include "progress.hpp"
#include "resume_downloader.hpp"
#include "retry_policy.hpp"

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-V") {
            fmt::print("rangefetch v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libcurl: HTTP/HTTPS support\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            return 0;
        }
    }

    CLI::App app{"rangefetch v1.0 - Resumable single-file downloader"};

    DownloadConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    auto *skuOption = app.add_option("SKU", config.sku, "SKU of the book to download");

    auto *customerOption = app.add_option("--customer-id", config.customerId, "Audible customer id");

    auto *urlOption = app.add_option("--url", config.url, "Download this URL instead of an Audible SKU")
        ->check([](const std::string &url) -> std::string {
            // Custom validator: check if URL starts with http:// or https://
            if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
                return "";  // Empty string = valid
            }
            return "URL must start with http:// or https://";
        });
    urlOption->excludes(skuOption);
    urlOption->excludes(customerOption);
    skuOption->needs(customerOption);
    customerOption->needs(skuOption);

    app.add_option("-o,--output", config.output, "Output file (default: <SKU>.aax)");

    app.add_flag("-v,--verbose", config.verbose, "Verbose output");

    app.add_option("--user-agent", config.userAgent, "Client identity sent with each request")
        ->capture_default_str();

    app.add_option("--retry-delay", config.retryDelayMs,
                   "Milliseconds to wait before resuming after a network error")
        ->check(CLI::Range(MIN_RETRY_DELAY_MS, MAX_RETRY_DELAY_MS))
        ->capture_default_str();

    app.add_option("--progress-interval", config.progressIntervalMs,
                   "Milliseconds between progress updates")
        ->check(CLI::Range(MIN_PROGRESS_INTERVAL_MS, MAX_PROGRESS_INTERVAL_MS))
        ->capture_default_str();

    app.add_option("--stall-timeout", config.stallTimeoutSeconds,
                   "Restart a transfer that receives no data for this many seconds (0 = never)")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();

    // Optional flag: --version (for help display only, actual handling is done above)
    app.add_flag("-V,--version", config.showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    // ====================================================================
    // PERFORM DOWNLOAD
    // ====================================================================

    try
    {
        validateConfig(config);
        DownloadTarget target{buildDownloadUrl(config), resolveOutputPath(config)};

        if (config.verbose)
        {
            fmt::print(stderr, "URL:         {}\n", target.url);
            fmt::print(stderr, "Destination: {}\n", target.outputPath.string());
        }

        // Create HTTP client (RAII ensures cleanup)
        HttpClient client(config.userAgent, config.stallTimeoutSeconds);
        FixedDelayRetryPolicy retryPolicy{std::chrono::milliseconds(config.retryDelayMs)};

        ProgressState progress;
        ConsoleProgress display;
        ProgressReporter reporter(progress, display, std::chrono::milliseconds(config.progressIntervalMs));
        reporter.start();

        ResumeDownloader downloader(target, client, retryPolicy, progress, display, config.verbose);
        DownloadOutcome outcome = downloader.run();
        reporter.stop();
        display.close();

        if (!outcome.ok())
        {
            if (config.verbose)
            {
                fmt::print(stderr, "Error ({}): {}\n", errorKindName(outcome.errorKind), outcome.error);
            }
            else
            {
                fmt::print(stderr, "Error: {}\n", outcome.error);
            }
            return 1;
        }

        if (config.verbose && outcome.retries > 0)
        {
            fmt::print(stderr, "Resumed {} {}\n", outcome.retries, outcome.retries == 1 ? "time" : "times");
        }
        return 0;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
