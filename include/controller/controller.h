#pragma once

#include <stdexcept>
#include <string>
#include "storage/storage.h"
#include "engine/config.h"
#include "engine/event_recorder.h"

namespace kubesim {

// 集群不变量被破坏：属于程序错误，中止当前tick
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

// 一次调和过程中各控制器共享的上下文
struct TickContext {
    ClusterStore& store;
    EventRecorder& recorder;
    const SimulatorConfig& config;
    Tick tick;

    TickContext(ClusterStore& s, EventRecorder& r, const SimulatorConfig& c, Tick t)
        : store(s), recorder(r), config(c), tick(t) {}

    void normal(ResourceKind kind, const std::string& name, const std::string& reason,
                const std::string& message) {
        recorder.record(tick, EventType::Normal, reason, kind, name, message);
    }

    void warning(ResourceKind kind, const std::string& name, const std::string& reason,
                 const std::string& message) {
        recorder.record(tick, EventType::Warning, reason, kind, name, message);
    }
};

// 控制器接口
class Controller {
public:
    virtual ~Controller() = default;

    virtual std::string name() const = 0;
    virtual void reconcile(TickContext& ctx) = 0;
};

// 未删除且未结束的Pod
bool is_active_pod(const Pod& pod);

// 标记删除：未结束的Pod进入Terminating，下一次垃圾回收时移除
void mark_pod_deleting(Pod& pod, Tick tick);

// 标记删除任意对象（Pod请使用mark_pod_deleting）
void mark_deleting(ObjectMeta& meta, Tick tick);

// 5位生成名后缀，由种子确定
std::string name_suffix(uint64_t seed);

// 生成"<base>-<5位后缀>"形式的对象名，后缀由存储序号确定
template<typename T>
std::string generate_name(const ClusterStore& store, const std::string& base, const std::string& namespace_) {
    uint64_t seed = store.last_sequence() + 1;
    for (;;) {
        std::string name = base + "-" + name_suffix(seed);
        if (!store.get<T>(name, namespace_)) {
            return name;
        }
        seed += 0x10000;
    }
}

std::string generate_pod_name(const ClusterStore& store, const std::string& base,
                              const std::string& namespace_);

// 按模板创建属于owner的Pod
Pod& create_pod_from_template(TickContext& ctx, const PodTemplate& tmpl, const std::string& name,
                              const std::string& namespace_, const OwnerReference& owner);

template<typename T>
OwnerReference owner_reference_for(const T& obj) {
    return OwnerReference(T::KIND, obj.metadata.name, obj.metadata.uid);
}

} // namespace kubesim
