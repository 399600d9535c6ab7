// include/Kiln/LaunchedInstances.hpp
#ifndef KILN_LAUNCHED_INSTANCES_HPP
#define KILN_LAUNCHED_INSTANCES_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace Kiln {

    // Ordered: a running instance only ever moves to a later state.
    enum class RunState {
        Launching = 0,
        RendererReady = 1,
        Splash = 2,
        Running = 3,
    };

    std::string run_state_to_string(RunState state);

    // State a stdout line points to, or nothing when the line carries no signal.
    std::optional<RunState> classifyLine(RunState current, const std::string& line);

    // Lines the game prints for errors it caught itself
    bool isInternalErrorLine(const std::string& line);

    class LaunchedInstances {
    public:
        // state is empty when the instance was removed
        using Listener = std::function<void(const std::string& id, std::optional<RunState> state)>;

        bool tryAdd(const std::string& id, RunState initial = RunState::Launching);

        // Compare-and-swap; false when the instance is missing or not in `from`.
        bool tryTransition(const std::string& id, RunState from, RunState to);

        // Moves to `to` only if it is later than the current state.
        bool advanceTo(const std::string& id, RunState to);

        bool remove(const std::string& id);
        std::optional<RunState> get(const std::string& id) const;
        bool contains(const std::string& id) const { return get(id).has_value(); }
        std::map<std::string, RunState> snapshot() const;

        size_t addListener(Listener listener);
        void removeListener(size_t handle);

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, RunState> m_states;
        std::map<size_t, Listener> m_listeners;
        size_t m_nextListener = 0;

        void notify(const std::string& id, std::optional<RunState> state);
    };

} // namespace Kiln

#endif // KILN_LAUNCHED_INSTANCES_HPP
