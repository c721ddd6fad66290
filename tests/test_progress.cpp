#include "console_progress.hpp"
#include "progress.hpp"
#include "test_support.hpp"

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <thread>

#include <fmt/core.h>

namespace
{

class ThrowingSink : public ProgressSink
{
public:
    void onTick(const ProgressSnapshot &) override
    {
        ++calls;
        throw std::runtime_error("terminal went away");
    }
    void onMessage(const std::string &) override {}
    void onComplete(const std::string &) override {}

    int calls = 0;
};

bool contains(const std::string &text, const std::string &part)
{
    return text.find(part) != std::string::npos;
}

void testState(TestReport &report)
{
    ProgressState state;
    auto snap = state.snapshot();
    report.check(snap.position == 0 && snap.length == 0 && !snap.finished && !snap.downloading,
                 "new state is empty");

    state.setInitiating("Initiating download...");
    report.check(state.snapshot().message == "Initiating download...", "initiating message is stored");

    state.beginTransfer(1000, 250);
    state.advance(100);
    state.advance(50);
    snap = state.snapshot();
    report.check(snap.downloading && snap.length == 1000 && snap.position == 400 && snap.cycle == 1,
                 "transfer sets length and position, chunks advance it");

    state.setInitiating("Restarting download...");
    snap = state.snapshot();
    report.check(!snap.downloading && snap.position == 400 && snap.message == "Restarting download...",
                 "restarting keeps the position");

    state.beginTransfer(1000, 400);
    report.check(state.snapshot().cycle == 2, "each transfer starts a new cycle");

    state.finish();
    report.check(state.isFinished() && state.snapshot().finished, "finish is visible");
}

void testReporterTicksUntilFinished(TestReport &report)
{
    ProgressState state;
    RecordingSink sink;
    ProgressReporter reporter(state, sink, std::chrono::milliseconds(5));
    reporter.start();

    state.beginTransfer(100, 0);
    for (int i = 0; i < 10; ++i)
    {
        state.advance(10);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    state.finish();

    // The reporter notices on its own within one interval
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto ticksAfterFinish = reporter.tickCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    report.check(reporter.tickCount() == ticksAfterFinish, "reporter stops ticking once finished");

    reporter.stop();
    auto ticks = sink.ticks();
    report.check(ticks.size() >= 2, "reporter ticks periodically");
    report.check(!ticks.empty() && ticks.back().position == 100, "last tick shows the final position");

    bool monotonic = true;
    for (std::size_t i = 1; i < ticks.size(); ++i)
    {
        monotonic = monotonic && ticks[i].position >= ticks[i - 1].position;
    }
    report.check(monotonic, "reported position never decreases");
    report.check(state.position() == 100, "reporter never changes the state");
}

void testReporterStop(TestReport &report)
{
    ProgressState state;
    RecordingSink sink;
    ProgressReporter reporter(state, sink, std::chrono::hours(1));
    reporter.start();

    auto start = std::chrono::steady_clock::now();
    reporter.stop();
    auto waited = std::chrono::steady_clock::now() - start;
    report.check(waited < std::chrono::seconds(5), "stop wakes a sleeping reporter");
    report.check(sink.ticks().size() >= 1, "stopped reporter still drew the state");
    const auto ticksAfterStop = sink.ticks().size();
    const auto countAfterStop = reporter.tickCount();
    reporter.stop();
    report.check(sink.ticks().size() == ticksAfterStop && reporter.tickCount() == countAfterStop,
                 "a second stop draws nothing more");
}

void testFailingDisplay(TestReport &report)
{
    ProgressState state;
    ThrowingSink sink;
    {
        ProgressReporter reporter(state, sink, std::chrono::milliseconds(1));
        reporter.start();
        state.beginTransfer(10, 0);
        state.advance(10);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    report.check(sink.calls == 1, "a failing display is dropped after its first error");
    report.check(state.position() == 10 && !state.isFinished(), "a failing display does not affect the transfer");
}

void testFormatting(TestReport &report)
{
    report.check(ConsoleProgress::formatBytes(512) == "512 B", "formats bytes");
    report.check(ConsoleProgress::formatBytes(1536) == "1.50 KB", "formats kilobytes");
    report.check(ConsoleProgress::formatBytes(5ull * 1024 * 1024 * 1024) == "5.00 GB", "formats gigabytes");
    report.check(ConsoleProgress::formatDuration(45) == "45s", "formats seconds");
    report.check(ConsoleProgress::formatDuration(90) == "1m 30s", "formats minutes");
    report.check(ConsoleProgress::formatDuration(7320) == "2h 2m", "formats hours");
    report.check(ConsoleProgress::formatElapsed(3725) == "01:02:05", "formats elapsed time");

    ProgressSnapshot initiating;
    initiating.message = "Restarting download...";
    auto line = ConsoleProgress::renderLine(initiating, 3, 0.0);
    report.check(contains(line, "00:00:03") && contains(line, "Restarting download..."),
                 "initiating line shows elapsed time and message");

    ProgressSnapshot downloading;
    downloading.downloading = true;
    downloading.position = 512;
    downloading.length = 1024;
    line = ConsoleProgress::renderLine(downloading, 0, 256.0);
    report.check(contains(line, "512 B/1.00 KB") && contains(line, "256 B/s") && contains(line, "ETA: 2s"),
                 "downloading line shows bytes, speed and ETA");
    report.check(contains(line, "#################>"), "bar is half full");
}

void testConsoleOutput(TestReport &report)
{
    std::FILE *out = std::tmpfile();
    if (!out)
    {
        report.check(false, "tmpfile available");
        return;
    }

    {
        ConsoleProgress display(out);
        ProgressSnapshot snap;
        snap.message = "Initiating download...";
        display.onTick(snap);
        display.onMessage("Downloading from offset 0");
        display.close();
        display.onTick(snap);
    }

    std::fflush(out);
    std::rewind(out);
    std::string text;
    char buffer[256];
    while (std::fgets(buffer, sizeof(buffer), out))
    {
        text += buffer;
    }
    std::fclose(out);

    report.check(contains(text, "Initiating download...\n"), "piped output prints one line per tick");
    report.check(contains(text, "Downloading from offset 0\n"), "messages are printed on their own line");
    report.check(text.find("Initiating") == text.rfind("Initiating"), "ticks after close are ignored");
}

} // namespace

int main()
{
    TestReport report;
    try
    {
        testState(report);
        testReporterTicksUntilFinished(report);
        testReporterStop(report);
        testFailingDisplay(report);
        testFormatting(report);
        testConsoleOutput(report);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
    return report.finish();
}
