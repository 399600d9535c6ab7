// include/Kiln/Utils/WorkerPool.hpp
#ifndef KILN_WORKER_POOL_HPP
#define KILN_WORKER_POOL_HPP

#include <Kiln/Utils/Cancellation.hpp>
#include <Kiln/Errors.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <vector>

namespace Kiln::Utils {

    class WorkerPool {
    public:
        // 0 picks hardware_concurrency(), at least 4.
        explicit WorkerPool(size_t threads = 0);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        size_t threadCount() const { return m_threadCount; }

        template <typename F>
        auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
            using Result = std::invoke_result_t<std::decay_t<F>>;
            auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
            std::future<Result> future = task->get_future();
            boost::asio::post(m_pool, [task]() { (*task)(); });
            return future;
        }

        /**
         * @brief Runs fn(item) for every item with at most maxParallel running at once.
         *
         * The calling thread works through items too, so helpers that never get a pool
         * thread are simply skipped; calling this from inside a pool task cannot deadlock.
         * The first exception stops the remaining items and is rethrown once every started
         * item has returned. A cancelled token stops scheduling and throws
         * OperationCancelledError.
         */
        template <typename T, typename F>
        void parallelForEach(const std::vector<T>& items, size_t maxParallel, F&& fn,
                             const CancellationToken& token = {}) {
            if (items.empty()) {
                token.throwIfCancelled();
                return;
            }

            struct Shared {
                const std::vector<T>* items;
                std::remove_reference_t<F>* fn;
                CancellationToken token;
                std::atomic<size_t> next{0};
                std::atomic<bool> failed{false};
                std::exception_ptr error;
                std::mutex mutex;
                std::condition_variable cv;
                size_t active = 0;
                bool closed = false;

                void work() {
                    while (!failed.load() && !token.isCancelled()) {
                        size_t index = next.fetch_add(1);
                        if (index >= items->size())
                            break;
                        try {
                            (*fn)((*items)[index]);
                        } catch (...) {
                            std::lock_guard<std::mutex> lock(mutex);
                            if (!error)
                                error = std::current_exception();
                            failed.store(true);
                        }
                    }
                }
            };

            auto shared = std::make_shared<Shared>();
            shared->items = &items;
            shared->fn = &fn;
            shared->token = token;

            size_t helpers = std::min(std::max<size_t>(maxParallel, 1), items.size()) - 1;
            for (size_t i = 0; i < helpers; ++i) {
                boost::asio::post(m_pool, [shared]() {
                    {
                        std::lock_guard<std::mutex> lock(shared->mutex);
                        if (shared->closed)
                            return;
                        ++shared->active;
                    }
                    shared->work();
                    {
                        std::lock_guard<std::mutex> lock(shared->mutex);
                        --shared->active;
                    }
                    shared->cv.notify_all();
                });
            }

            shared->work();

            std::unique_lock<std::mutex> lock(shared->mutex);
            shared->closed = true;
            shared->cv.wait(lock, [&]() { return shared->active == 0; });

            if (shared->error) {
                std::rethrow_exception(shared->error);
            }
            lock.unlock();
            token.throwIfCancelled();
        }

    private:
        size_t m_threadCount;
        boost::asio::thread_pool m_pool;
    };

} // namespace Kiln::Utils

#endif // KILN_WORKER_POOL_HPP
