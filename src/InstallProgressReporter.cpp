// src/InstallProgressReporter.cpp
#include <Kiln/InstallProgressReporter.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <algorithm>
#include <exception>
#include <vector>

namespace Kiln {

    InstallProgressReporter::InstallProgressReporter(std::string targetId, Observer observer)
        : m_observer(std::move(observer)) {
        m_logger = Utils::Logger::GetOrCreateLogger("ProgressReporter");
        m_current.targetId = std::move(targetId);
        m_consumer = std::thread([this]() { run(); });
    }

    InstallProgressReporter::~InstallProgressReporter() {
        dispose();
    }

    void InstallProgressReporter::reportStart() { enqueue(Kind::Reset, 0); }
    void InstallProgressReporter::reportFinished() { enqueue(Kind::Finished, 100); }
    void InstallProgressReporter::reportClientProgress(uint32_t percent) { enqueue(Kind::Client, percent); }
    void InstallProgressReporter::reportAssetsProgress(uint32_t percent) { enqueue(Kind::Assets, percent); }
    void InstallProgressReporter::reportLibrariesProgress(uint32_t percent) { enqueue(Kind::Libraries, percent); }
    void InstallProgressReporter::reportJavaProgress(uint32_t percent) { enqueue(Kind::Java, percent); }

    void InstallProgressReporter::enqueue(Kind kind, uint32_t value) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping)
                return;
            m_queue.push_back(Update{kind, std::min<uint32_t>(value, 100)});
        }
        m_cv.notify_one();
    }

    bool InstallProgressReporter::apply(InstallProgress& progress, const Update& update) {
        InstallProgress before = progress;
        switch (update.kind) {
            case Kind::Reset:
                progress.isValid = true;
                progress.client = progress.assets = progress.libraries = progress.java = 0;
                break;
            case Kind::Finished:
                progress.isValid = true;
                progress.client = progress.assets = progress.libraries = progress.java = 100;
                break;
            case Kind::Client:
                progress.client = std::max(progress.client, update.value);
                break;
            case Kind::Assets:
                progress.assets = std::max(progress.assets, update.value);
                break;
            case Kind::Libraries:
                progress.libraries = std::max(progress.libraries, update.value);
                break;
            case Kind::Java:
                progress.java = std::max(progress.java, update.value);
                break;
        }
        return progress != before;
    }

    void InstallProgressReporter::run() {
        std::vector<Update> batch;
        while (true) {
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_busy = false;
                m_idleCv.notify_all();
                m_cv.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });
                if (m_stopping)
                    return;
                batch.assign(m_queue.begin(), m_queue.end());
                m_queue.clear();
                m_busy = true;
            }

            // Only this thread writes m_current, reads from current() take the lock
            for (const auto& update : batch) {
                std::lock_guard<std::mutex> publishLock(m_publishMutex);
                InstallProgress next;
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    if (m_stopping)
                        return;
                    if (!apply(m_current, update))
                        continue;
                    next = m_current;
                }
                if (m_observer) {
                    try {
                        m_observer(next);
                    } catch (const std::exception& e) {
                        m_logger->warn("[{}] Progress observer threw: {}", next.targetId, e.what());
                    }
                }
            }
        }
    }

    void InstallProgressReporter::flush() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idleCv.wait(lock, [this]() { return m_stopping || (m_queue.empty() && !m_busy); });
    }

    void InstallProgressReporter::dispose() {
        const bool onConsumer = m_consumer.get_id() == std::this_thread::get_id();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_disposed && !m_consumer.joinable())
                return;
            m_stopping = true;
            m_queue.clear();
        }
        m_cv.notify_all();
        m_idleCv.notify_all();
        {
            // An observer calling dispose() already holds the publish lock
            std::unique_lock<std::mutex> publishLock(m_publishMutex, std::defer_lock);
            if (!onConsumer)
                publishLock.lock();
            std::lock_guard<std::mutex> lock(m_mutex);
            m_disposed = true;
        }
        if (m_consumer.joinable() && !onConsumer) {
            m_consumer.join();
        }
    }

    bool InstallProgressReporter::isDisposed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_disposed;
    }

    InstallProgress InstallProgressReporter::current() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_current;
    }

} // namespace Kiln
