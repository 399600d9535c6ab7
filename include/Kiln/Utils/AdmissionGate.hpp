// include/Kiln/Utils/AdmissionGate.hpp
#ifndef KILN_ADMISSION_GATE_HPP
#define KILN_ADMISSION_GATE_HPP

#include <Kiln/Utils/Cancellation.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace Kiln::Utils {

    // Counting semaphore bounding how many transfers run at once.
    class AdmissionGate {
    public:
        explicit AdmissionGate(size_t slots);

        AdmissionGate(const AdmissionGate&) = delete;
        AdmissionGate& operator=(const AdmissionGate&) = delete;

        // Blocks until a slot frees. Throws OperationCancelledError if the token fires while waiting.
        void acquire(const CancellationToken& token = {});
        void release();

        size_t available() const;
        size_t capacity() const { return m_capacity; }

        // Holds one slot for the lifetime of the guard.
        class Slot {
        public:
            Slot(AdmissionGate& gate, const CancellationToken& token) : m_gate(&gate) { m_gate->acquire(token); }
            ~Slot() { m_gate->release(); }

            Slot(const Slot&) = delete;
            Slot& operator=(const Slot&) = delete;

        private:
            AdmissionGate* m_gate;
        };

    private:
        const size_t m_capacity;
        size_t m_available;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
    };

} // namespace Kiln::Utils

#endif // KILN_ADMISSION_GATE_HPP
