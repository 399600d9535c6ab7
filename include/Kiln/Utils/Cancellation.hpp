// include/Kiln/Utils/Cancellation.hpp
#ifndef KILN_CANCELLATION_HPP
#define KILN_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <vector>

namespace Kiln::Utils {

    namespace detail {
        struct CancellationState {
            std::atomic<bool> cancelled{false};
            // steady_clock ticks, 0 when no deadline is set
            std::atomic<std::chrono::steady_clock::rep> deadline{0};
            std::vector<std::shared_ptr<CancellationState>> parents;

            bool isCancelled();
        };
    } // namespace detail

    class CancellationToken {
    public:
        // A token that can never be cancelled.
        CancellationToken() = default;

        bool isCancelled() const;
        bool canBeCancelled() const { return m_state != nullptr; }

        // Throws OperationCancelledError once cancelled.
        void throwIfCancelled() const;

        // Sleeps up to `duration`, waking early on cancellation. Returns false if cancelled.
        bool sleepFor(std::chrono::milliseconds duration) const;

    private:
        friend class CancellationSource;
        explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : m_state(std::move(state)) {}

        std::shared_ptr<detail::CancellationState> m_state;
    };

    class CancellationSource {
    public:
        CancellationSource();

        // Reports cancelled when this source or any of the given tokens is cancelled.
        static CancellationSource linked(std::initializer_list<CancellationToken> tokens);

        void cancel();
        void cancelAfter(std::chrono::milliseconds delay);
        bool isCancelled() const;
        CancellationToken token() const;

    private:
        std::shared_ptr<detail::CancellationState> m_state;
    };

} // namespace Kiln::Utils

#endif // KILN_CANCELLATION_HPP
