// src/Utils/WorkerPool.cpp
#include <Kiln/Utils/WorkerPool.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <thread>

namespace Kiln::Utils {

    namespace {
        size_t resolveThreadCount(size_t requested) {
            if (requested != 0)
                return requested;
            // hardware_concurrency() may report 0
            size_t n = std::thread::hardware_concurrency();
            return std::max<size_t>(n, 4);
        }
    } // namespace

    WorkerPool::WorkerPool(size_t threads)
        : m_threadCount(resolveThreadCount(threads)), m_pool(m_threadCount) {
        KILN_LOG_DEBUG("Worker pool started with {} threads", m_threadCount);
    }

    WorkerPool::~WorkerPool() {
        m_pool.join();
    }

} // namespace Kiln::Utils
