// include/Kiln/InstallProgressReporter.hpp
#ifndef KILN_INSTALL_PROGRESS_REPORTER_HPP
#define KILN_INSTALL_PROGRESS_REPORTER_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <spdlog/logger.h>

namespace Kiln {

    // Percentages in [0, 100]
    struct InstallProgress {
        std::string targetId;
        bool isValid = false;
        uint32_t client = 0;
        uint32_t assets = 0;
        uint32_t libraries = 0;
        uint32_t java = 0;

        bool operator==(const InstallProgress& other) const {
            return targetId == other.targetId && isValid == other.isValid && client == other.client &&
                   assets == other.assets && libraries == other.libraries && java == other.java;
        }
        bool operator!=(const InstallProgress& other) const { return !(*this == other); }
    };

    /**
     * Collects progress from any number of threads and publishes snapshots from a single
     * consumer thread. Producers only enqueue; the consumer merges each gauge with max(), so
     * published gauges never go down whatever order updates arrive in. Only a reset lowers them.
     */
    class InstallProgressReporter {
    public:
        using Observer = std::function<void(const InstallProgress&)>;

        InstallProgressReporter(std::string targetId, Observer observer);
        ~InstallProgressReporter();

        InstallProgressReporter(const InstallProgressReporter&) = delete;
        InstallProgressReporter& operator=(const InstallProgressReporter&) = delete;

        // Zeroes every gauge and marks the snapshot valid.
        void reportStart();
        // Every gauge to 100.
        void reportFinished();

        void reportClientProgress(uint32_t percent);
        void reportAssetsProgress(uint32_t percent);
        void reportLibrariesProgress(uint32_t percent);
        void reportJavaProgress(uint32_t percent);

        // Blocks until everything enqueued so far has been applied and published.
        void flush();

        // Stops the consumer and drops pending updates. Returns once a publish in progress
        // has finished. Safe to call from the observer.
        void dispose();

        // True once no observer call can be running or start again
        bool isDisposed() const;

        InstallProgress current() const;

    private:
        enum class Kind : uint8_t {
            Reset,
            Finished,
            Client,
            Assets,
            Libraries,
            Java
        };

        struct Update {
            Kind kind;
            uint32_t value;
        };

        void enqueue(Kind kind, uint32_t value);
        void run();
        static bool apply(InstallProgress& progress, const Update& update);

        Observer m_observer;
        std::shared_ptr<spdlog::logger> m_logger;

        // Held across each observer call, and by dispose() while it sets m_disposed
        std::mutex m_publishMutex;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::condition_variable m_idleCv;
        std::deque<Update> m_queue;
        bool m_busy = false;
        bool m_stopping = false;
        bool m_disposed = false;
        InstallProgress m_current;

        std::thread m_consumer;
    };

} // namespace Kiln

#endif // KILN_INSTALL_PROGRESS_REPORTER_HPP
