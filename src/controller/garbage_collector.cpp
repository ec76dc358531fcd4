#include "controller/garbage_collector.h"
#include <spdlog/spdlog.h>

namespace kubesim {

void GarbageCollector::mark_dependent(TickContext& ctx, const DependentRef& dependent) {
    switch (dependent.kind) {
        case ResourceKind::Pod:
            if (Pod* pod = ctx.store.table<Pod>().find_by_uid(dependent.uid)) {
                mark_pod_deleting(*pod, ctx.tick);
            }
            break;
        case ResourceKind::ReplicaSet:
            if (ReplicaSet* rs = ctx.store.table<ReplicaSet>().find_by_uid(dependent.uid)) {
                mark_deleting(rs->metadata, ctx.tick);
            }
            break;
        case ResourceKind::Job:
            if (Job* job = ctx.store.table<Job>().find_by_uid(dependent.uid)) {
                mark_deleting(job->metadata, ctx.tick);
            }
            break;
        default:
            spdlog::warn("[GarbageCollector] unexpected dependent kind {}", kind_to_string(dependent.kind));
            break;
    }
}

template<typename T>
void GarbageCollector::cascade(TickContext& ctx) {
    for (T* owner : ctx.store.list<T>()) {
        if (!owner->metadata.is_deleting()) {
            continue;
        }
        for (const auto& dependent : ctx.store.dependents(owner->metadata.uid)) {
            mark_dependent(ctx, dependent);
        }
    }
}

template<typename T>
int GarbageCollector::collect(TickContext& ctx) {
    int removed = 0;
    for (T* obj : ctx.store.list<T>()) {
        const auto& meta = obj->metadata;
        // 当前tick设置的删除标记保留到下一个tick
        if (!meta.deletion_tick || *meta.deletion_tick >= ctx.tick) {
            continue;
        }
        if (ctx.store.has_dependents(meta.uid)) {
            continue;
        }

        std::string name = meta.name;
        if (ctx.store.remove<T>(meta.uid)) {
            ++removed;
            spdlog::debug("[GarbageCollector] removed {} {}", kind_to_string(T::KIND), name);
        }
    }
    return removed;
}

void GarbageCollector::reconcile(TickContext& ctx) {
    // 自上而下级联
    cascade<Deployment>(ctx);
    cascade<CronJob>(ctx);
    cascade<StatefulSet>(ctx);
    cascade<DaemonSet>(ctx);
    cascade<ReplicaSet>(ctx);
    cascade<Job>(ctx);

    // 自下而上移除
    int removed = collect<Pod>(ctx);
    removed += collect<ReplicaSet>(ctx);
    removed += collect<Job>(ctx);
    removed += collect<Deployment>(ctx);
    removed += collect<CronJob>(ctx);
    removed += collect<StatefulSet>(ctx);
    removed += collect<DaemonSet>(ctx);
    removed += collect<HorizontalPodAutoscaler>(ctx);
    removed += collect<PodDisruptionBudget>(ctx);
    removed += collect<Service>(ctx);
    removed += collect<PersistentVolumeClaim>(ctx);
    removed += collect<PersistentVolume>(ctx);
    removed += collect<StorageClass>(ctx);
    removed += collect<Node>(ctx);

    if (removed > 0) {
        spdlog::debug("[GarbageCollector] tick {}: removed {} object(s)", ctx.tick, removed);
    }
}

} // namespace kubesim
