#include "controller/statefulset_controller.h"
#include "api/labels.h"
#include <spdlog/spdlog.h>

namespace kubesim {

StatefulSetStatus StatefulSetController::compute_status(ClusterStore& store, const StatefulSet& sts) {
    StatefulSetStatus status;
    status.update_revision = compute_template_hash(sts.spec.template_);
    for (const Pod* pod : store.owned_by<Pod>(sts.metadata.uid)) {
        if (!is_active_pod(*pod)) {
            continue;
        }
        ++status.replicas;
        ++status.current_replicas;
        if (pod->is_healthy()) {
            ++status.ready_replicas;
        }
        auto it = pod->metadata.labels.find(REVISION_LABEL);
        if (it != pod->metadata.labels.end() && it->second == status.update_revision) {
            ++status.updated_replicas;
        }
    }
    return status;
}

void StatefulSetController::create_ordinal(TickContext& ctx, StatefulSet& sts, int32_t ordinal,
                                           const std::string& revision) {
    PodTemplate tmpl = sts.spec.template_;
    tmpl.labels[LabelKeys::POD_INDEX] = std::to_string(ordinal);
    tmpl.labels[REVISION_LABEL] = revision;
    tmpl.spec.ordinal = ordinal;

    std::string pod_name = sts.metadata.name + "-" + std::to_string(ordinal);
    create_pod_from_template(ctx, tmpl, pod_name, sts.metadata.namespace_, owner_reference_for(sts));
}

void StatefulSetController::delete_pod(TickContext& ctx, StatefulSet& sts, Pod& pod, const std::string& reason) {
    mark_pod_deleting(pod, ctx.tick);
    ctx.normal(ResourceKind::StatefulSet, sts.metadata.name, "SuccessfulDelete",
               "Deleted pod " + pod.metadata.name + " (" + reason + ")");
}

void StatefulSetController::report_conflict(TickContext& ctx, const StatefulSet& sts, const std::string& pod_name) {
    std::string key = sts.metadata.uid + "/" + pod_name;
    conflicts_.insert(key);
    if (reported_conflicts_.count(key)) {
        return;
    }
    ctx.warning(ResourceKind::StatefulSet, sts.metadata.name, "FailedCreate",
                "pod " + pod_name + " already exists and is not owned by StatefulSet " + sts.metadata.name);
}

void StatefulSetController::sync(TickContext& ctx, StatefulSet& sts) {
    const std::string revision = compute_template_hash(sts.spec.template_);

    std::map<int32_t, Pod*> by_ordinal;
    for (Pod* pod : ctx.store.owned_by<Pod>(sts.metadata.uid)) {
        if (pod->metadata.is_deleting() || !pod->spec.ordinal) {
            continue;
        }
        if (pod->is_terminal()) {
            delete_pod(ctx, sts, *pod, "pod terminated");
            continue;
        }
        by_ordinal[*pod->spec.ordinal] = pod;
    }

    // 缩容：先删最大序号
    if (!by_ordinal.empty() && by_ordinal.rbegin()->first >= sts.spec.replicas) {
        delete_pod(ctx, sts, *by_ordinal.rbegin()->second, "scale down");
        return;
    }

    // 创建最小的缺失序号
    for (int32_t ordinal = 0; ordinal < sts.spec.replicas; ++ordinal) {
        if (by_ordinal.count(ordinal)) {
            continue;
        }
        std::string pod_name = sts.metadata.name + "-" + std::to_string(ordinal);
        const Pod* existing = ctx.store.get<Pod>(pod_name, sts.metadata.namespace_);
        if (existing && !existing->metadata.is_owned_by(sts.metadata.uid)) {
            report_conflict(ctx, sts, pod_name);
            return;
        }
        // 同名Pod仍在终止中
        if (existing) {
            spdlog::debug("[StatefulSetController] {} waiting for {} to terminate", sts.metadata.name, pod_name);
            return;
        }
        create_ordinal(ctx, sts, ordinal, revision);
        return;
    }

    // 全部就绪后，替换序号最大的旧版本Pod
    for (const auto& [ordinal, pod] : by_ordinal) {
        if (!pod->is_healthy()) {
            return;
        }
    }
    for (auto it = by_ordinal.rbegin(); it != by_ordinal.rend(); ++it) {
        auto label = it->second->metadata.labels.find(REVISION_LABEL);
        if (label == it->second->metadata.labels.end() || label->second != revision) {
            delete_pod(ctx, sts, *it->second, "update to revision " + revision);
            return;
        }
    }
}

void StatefulSetController::reconcile(TickContext& ctx) {
    conflicts_.clear();
    for (StatefulSet* sts : ctx.store.list<StatefulSet>()) {
        if (sts->metadata.is_deleting()) {
            for (Pod* pod : ctx.store.owned_by<Pod>(sts->metadata.uid)) {
                mark_pod_deleting(*pod, ctx.tick);
            }
            continue;
        }
        sync(ctx, *sts);
    }
    // 仅在冲突首次出现时告警
    reported_conflicts_.swap(conflicts_);
}

} // namespace kubesim
