// src/LaunchedInstances.cpp
#include <Kiln/LaunchedInstances.hpp>
#include <Kiln/Utils/Logger.hpp>

#include <exception>
#include <vector>

namespace Kiln {

std::string run_state_to_string(RunState state) {
    switch (state) {
        case RunState::Launching: return "launching";
        case RunState::RendererReady: return "renderer-ready";
        case RunState::Splash: return "splash";
        case RunState::Running: return "running";
    }
    return "unknown";
}

std::optional<RunState> classifyLine(RunState current, const std::string& line) {
    if (line.find("Sound engine started") != std::string::npos) {
        return RunState::Running;
    }
    if (line.find("Backend library:") != std::string::npos || line.find("LWJGL") != std::string::npos) {
        return RunState::RendererReady;
    }
    // first output after the renderer came up is the loading screen
    if (current == RunState::RendererReady) {
        return RunState::Splash;
    }
    return std::nullopt;
}

bool isInternalErrorLine(const std::string& line) {
    return line.find("[STDERR]") != std::string::npos;
}

bool LaunchedInstances::tryAdd(const std::string& id, RunState initial) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_states.emplace(id, initial).second)
            return false;
    }
    notify(id, initial);
    return true;
}

bool LaunchedInstances::tryTransition(const std::string& id, RunState from, RunState to) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_states.find(id);
        if (it == m_states.end() || it->second != from)
            return false;
        it->second = to;
    }
    notify(id, to);
    return true;
}

bool LaunchedInstances::advanceTo(const std::string& id, RunState to) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_states.find(id);
        if (it == m_states.end() || static_cast<int>(to) <= static_cast<int>(it->second))
            return false;
        it->second = to;
    }
    notify(id, to);
    return true;
}

bool LaunchedInstances::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_states.erase(id) == 0)
            return false;
    }
    notify(id, std::nullopt);
    return true;
}

std::optional<RunState> LaunchedInstances::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_states.find(id);
    if (it == m_states.end())
        return std::nullopt;
    return it->second;
}

std::map<std::string, RunState> LaunchedInstances::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_states;
}

size_t LaunchedInstances::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t handle = m_nextListener++;
    m_listeners.emplace(handle, std::move(listener));
    return handle;
}

void LaunchedInstances::removeListener(size_t handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listeners.erase(handle);
}

// Listeners run outside the lock so they may query the table.
void LaunchedInstances::notify(const std::string& id, std::optional<RunState> state) {
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [handle, listener] : m_listeners)
            listeners.push_back(listener);
    }
    for (const auto& listener : listeners) {
        try {
            listener(id, state);
        } catch (const std::exception& e) {
            KILN_LOG_WARN("Launched instance listener failed for '{}': {}", id, e.what());
        }
    }
}

} // namespace Kiln
