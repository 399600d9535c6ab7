// src/Utils/Cancellation.cpp
#include <Kiln/Utils/Cancellation.hpp>
#include <Kiln/Errors.hpp>

#include <algorithm>
#include <thread>

namespace Kiln::Utils {

    namespace detail {
        bool CancellationState::isCancelled() {
            if (cancelled.load(std::memory_order_acquire))
                return true;

            auto dl = deadline.load(std::memory_order_acquire);
            if (dl != 0 && std::chrono::steady_clock::now().time_since_epoch().count() >= dl) {
                cancelled.store(true, std::memory_order_release);
                return true;
            }

            for (const auto& parent : parents) {
                if (parent->isCancelled())
                    return true;
            }
            return false;
        }
    } // namespace detail

    bool CancellationToken::isCancelled() const {
        return m_state && m_state->isCancelled();
    }

    void CancellationToken::throwIfCancelled() const {
        if (isCancelled()) {
            throw OperationCancelledError();
        }
    }

    bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
        constexpr std::chrono::milliseconds slice(50);
        auto until = std::chrono::steady_clock::now() + duration;
        while (true) {
            if (isCancelled())
                return false;
            auto now = std::chrono::steady_clock::now();
            if (now >= until)
                return true;
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, until - now));
        }
    }

    CancellationSource::CancellationSource() : m_state(std::make_shared<detail::CancellationState>()) {}

    CancellationSource CancellationSource::linked(std::initializer_list<CancellationToken> tokens) {
        CancellationSource source;
        for (const auto& token : tokens) {
            if (token.m_state)
                source.m_state->parents.push_back(token.m_state);
        }
        return source;
    }

    void CancellationSource::cancel() {
        m_state->cancelled.store(true, std::memory_order_release);
    }

    void CancellationSource::cancelAfter(std::chrono::milliseconds delay) {
        auto at = std::chrono::steady_clock::now() + delay;
        m_state->deadline.store(std::max<std::chrono::steady_clock::rep>(at.time_since_epoch().count(), 1),
                                std::memory_order_release);
    }

    bool CancellationSource::isCancelled() const {
        return m_state->isCancelled();
    }

    CancellationToken CancellationSource::token() const {
        return CancellationToken(m_state);
    }

} // namespace Kiln::Utils
