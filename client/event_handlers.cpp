#include "event_handlers.H"

namespace tws::client {

EventHandlers::EventHandlers(std::shared_ptr<spdlog::logger> logger) : logger(logger) {}

handler_id EventHandlers::insert(int kind, any_handler callback) {
    std::lock_guard<std::mutex> lock(mutex);
    handler_id id = next_handler++;
    handlers[id] = entry{kind, std::move(callback)};
    return id;
}

handler_id EventHandlers::add_any(any_handler callback) {
    return insert(ANY_KIND, std::move(callback));
}

bool EventHandlers::remove(handler_id id) {
    std::lock_guard<std::mutex> lock(mutex);
    return handlers.erase(id) > 0;
}

size_t EventHandlers::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return handlers.size();
}

void EventHandlers::publish(const wire::event& ev) {
    int kind = static_cast<int>(ev.index());

    // copied so handlers may add or remove handlers
    std::vector<std::pair<handler_id, any_handler>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [id, e] : handlers) {
            if (e.kind == kind || e.kind == ANY_KIND) {
                targets.emplace_back(id, e.callback);
            }
        }
    }

    for (auto& [id, callback] : targets) {
        try {
            callback(ev);
        } catch (const std::exception& e) {
            logger->error("Handler {} failed on {}: {}", id, wire::event_name(ev), e.what());
        }
    }
}

} // namespace tws::client
