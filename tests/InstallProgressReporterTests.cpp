// tests/InstallProgressReporterTests.cpp
#include <doctest/doctest.h>

#include <Kiln/InstallProgressReporter.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

using Kiln::InstallProgress;
using Kiln::InstallProgressReporter;

namespace {

struct Recorder {
    std::mutex mutex;
    std::vector<InstallProgress> snapshots;

    InstallProgressReporter::Observer observer() {
        return [this](const InstallProgress& p) {
            std::lock_guard<std::mutex> lock(mutex);
            snapshots.push_back(p);
        };
    }
};

} // namespace

TEST_CASE("reset marks the snapshot valid with zeroed gauges") {
    Recorder recorder;
    InstallProgressReporter reporter("vanilla", recorder.observer());
    CHECK_FALSE(reporter.current().isValid);

    reporter.reportStart();
    reporter.flush();

    auto current = reporter.current();
    CHECK(current.isValid);
    CHECK(current.targetId == "vanilla");
    CHECK(current.client == 0);
    CHECK(current.java == 0);
    REQUIRE(recorder.snapshots.size() == 1);
}

TEST_CASE("gauges only move up") {
    Recorder recorder;
    InstallProgressReporter reporter("vanilla", recorder.observer());
    reporter.reportStart();
    reporter.reportAssetsProgress(40);
    reporter.reportAssetsProgress(10);
    reporter.reportAssetsProgress(70);
    reporter.reportLibrariesProgress(250);
    reporter.flush();

    auto current = reporter.current();
    CHECK(current.assets == 70);
    CHECK(current.libraries == 100);

    // the stale 10 changes nothing and publishes nothing
    CHECK(recorder.snapshots.size() == 4);
}

TEST_CASE("concurrent producers end at the maximum with a non-decreasing sequence") {
    Recorder recorder;
    InstallProgressReporter reporter("vanilla", recorder.observer());
    reporter.reportStart();

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&reporter, t]() {
            std::vector<uint32_t> values(100);
            for (uint32_t i = 0; i < values.size(); ++i)
                values[i] = i;
            std::shuffle(values.begin(), values.end(), std::mt19937(static_cast<unsigned>(t)));
            for (uint32_t v : values) {
                reporter.reportClientProgress(v);
                reporter.reportAssetsProgress(v);
                reporter.reportLibrariesProgress(v / 2);
                reporter.reportJavaProgress(v);
            }
        });
    }
    for (auto& p : producers)
        p.join();
    reporter.flush();

    auto current = reporter.current();
    CHECK(current.client == 99);
    CHECK(current.assets == 99);
    CHECK(current.libraries == 49);
    CHECK(current.java == 99);

    std::lock_guard<std::mutex> lock(recorder.mutex);
    for (size_t i = 1; i < recorder.snapshots.size(); ++i) {
        const auto& a = recorder.snapshots[i - 1];
        const auto& b = recorder.snapshots[i];
        CHECK(b.client >= a.client);
        CHECK(b.assets >= a.assets);
        CHECK(b.libraries >= a.libraries);
        CHECK(b.java >= a.java);
    }
}

TEST_CASE("finished fills every gauge") {
    InstallProgressReporter reporter("vanilla", nullptr);
    reporter.reportStart();
    reporter.reportClientProgress(5);
    reporter.reportFinished();
    reporter.flush();

    auto current = reporter.current();
    CHECK(current.client == 100);
    CHECK(current.assets == 100);
    CHECK(current.libraries == 100);
    CHECK(current.java == 100);
}

TEST_CASE("nothing is published after dispose") {
    Recorder recorder;
    InstallProgressReporter reporter("vanilla", recorder.observer());
    reporter.reportStart();
    reporter.flush();
    reporter.dispose();

    reporter.reportClientProgress(50);
    reporter.flush();
    CHECK(recorder.snapshots.size() == 1);
    CHECK(reporter.current().client == 0);

    CHECK_NOTHROW(reporter.dispose());
}

TEST_CASE("dispose waits for a publish in progress and drops what is queued behind it") {
    std::mutex gateMutex;
    std::condition_variable gateCv;
    bool entered = false;
    bool released = false;
    Recorder recorder;

    InstallProgressReporter reporter("vanilla", [&](const InstallProgress& p) {
        {
            std::unique_lock<std::mutex> lock(gateMutex);
            entered = true;
            gateCv.notify_all();
            gateCv.wait(lock, [&]() { return released; });
        }
        std::lock_guard<std::mutex> lock(recorder.mutex);
        recorder.snapshots.push_back(p);
    });
    reporter.reportStart();
    {
        std::unique_lock<std::mutex> lock(gateMutex);
        gateCv.wait(lock, [&]() { return entered; });
    }
    reporter.reportClientProgress(50);

    std::atomic<bool> disposed{false};
    std::thread disposer([&]() {
        reporter.dispose();
        disposed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    // dispose() is held up by the running observer
    CHECK_FALSE(disposed.load());
    CHECK_FALSE(reporter.isDisposed());

    {
        std::lock_guard<std::mutex> lock(gateMutex);
        released = true;
    }
    gateCv.notify_all();
    disposer.join();

    CHECK(reporter.isDisposed());
    std::lock_guard<std::mutex> lock(recorder.mutex);
    REQUIRE(recorder.snapshots.size() == 1);
    CHECK(recorder.snapshots[0].client == 0);
}

TEST_CASE("the observer may dispose its own reporter") {
    std::atomic<int> calls{0};
    std::unique_ptr<InstallProgressReporter> reporter;
    reporter = std::make_unique<InstallProgressReporter>("vanilla", [&](const InstallProgress&) {
        ++calls;
        reporter->dispose();
    });
    reporter->reportStart();
    reporter->reportClientProgress(10);
    reporter->flush();

    CHECK(reporter->isDisposed());
    CHECK(calls == 1);
    reporter.reset();
}

TEST_CASE("a throwing observer does not stop the consumer") {
    int calls = 0;
    InstallProgressReporter reporter("vanilla", [&calls](const InstallProgress&) {
        ++calls;
        throw std::runtime_error("observer failure");
    });
    reporter.reportStart();
    reporter.reportClientProgress(10);
    reporter.flush();

    CHECK(calls == 2);
    CHECK(reporter.current().client == 10);
}
