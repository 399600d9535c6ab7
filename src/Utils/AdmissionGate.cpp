// src/Utils/AdmissionGate.cpp
#include <Kiln/Utils/AdmissionGate.hpp>
#include <Kiln/Errors.hpp>

#include <chrono>
#include <stdexcept>

namespace Kiln::Utils {

    AdmissionGate::AdmissionGate(size_t slots) : m_capacity(slots), m_available(slots) {
        if (slots == 0) {
            throw std::invalid_argument("AdmissionGate needs at least one slot");
        }
    }

    void AdmissionGate::acquire(const CancellationToken& token) {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (m_available == 0) {
            if (token.isCancelled()) {
                throw OperationCancelledError();
            }
            // Timed wait so a cancelled token is noticed without a notification
            m_cv.wait_for(lock, std::chrono::milliseconds(100));
        }
        if (token.isCancelled()) {
            throw OperationCancelledError();
        }
        --m_available;
    }

    void AdmissionGate::release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_available;
        }
        m_cv.notify_one();
    }

    size_t AdmissionGate::available() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_available;
    }

} // namespace Kiln::Utils
