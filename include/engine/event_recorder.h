#pragma once

#include <deque>
#include <vector>
#include "api/types.h"

namespace kubesim {

// 只追加的事件日志，同时输出到spdlog
class EventRecorder {
public:
    explicit EventRecorder(size_t capacity = 0) : capacity_(capacity), dropped_(0) {}

    void record(Tick tick, EventType type, const std::string& reason,
                ResourceKind kind, const std::string& name, const std::string& message);

    const std::deque<Event>& events() const { return events_; }
    std::vector<Event> events_for(ResourceKind kind, const std::string& name) const;
    size_t count(const std::string& reason) const;
    std::optional<Event> last(const std::string& reason) const;

    // 超出容量后丢弃的最旧事件数
    uint64_t dropped() const { return dropped_; }
    void clear();

private:
    std::deque<Event> events_;
    size_t capacity_;
    uint64_t dropped_;
};

} // namespace kubesim
