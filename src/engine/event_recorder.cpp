#include "engine/event_recorder.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace kubesim {

void EventRecorder::record(Tick tick, EventType type, const std::string& reason,
                           ResourceKind kind, const std::string& name, const std::string& message) {
    if (type == EventType::Warning) {
        spdlog::warn("[tick {}] {} {}/{}: {}", tick, reason, kind_to_string(kind), name, message);
    } else {
        spdlog::info("[tick {}] {} {}/{}: {}", tick, reason, kind_to_string(kind), name, message);
    }

    events_.emplace_back(tick, type, reason, kind, name, message);
    if (capacity_ > 0 && events_.size() > capacity_) {
        events_.pop_front();
        ++dropped_;
    }
}

std::vector<Event> EventRecorder::events_for(ResourceKind kind, const std::string& name) const {
    std::vector<Event> result;
    for (const auto& event : events_) {
        if (event.object_kind == kind && event.object_name == name) {
            result.push_back(event);
        }
    }
    return result;
}

size_t EventRecorder::count(const std::string& reason) const {
    return std::count_if(events_.begin(), events_.end(),
                         [&reason](const Event& e) { return e.reason == reason; });
}

std::optional<Event> EventRecorder::last(const std::string& reason) const {
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->reason == reason) {
            return *it;
        }
    }
    return std::nullopt;
}

void EventRecorder::clear() {
    events_.clear();
    dropped_ = 0;
}

} // namespace kubesim
