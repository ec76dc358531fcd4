#include "controller/daemonset_controller.h"
#include "api/labels.h"
#include <set>
#include <spdlog/spdlog.h>

namespace kubesim {

bool DaemonSetController::node_eligible(const Node& node, const DaemonSet& ds) {
    return !node.metadata.is_deleting() && node.status.ready && !node.spec.unschedulable &&
           taints_tolerated(node.spec.taints, ds.spec.template_.spec.tolerations,
                            {TaintEffect::NoSchedule, TaintEffect::NoExecute});
}

DaemonSetStatus DaemonSetController::compute_status(ClusterStore& store, const DaemonSet& ds) {
    DaemonSetStatus status;
    for (const Node* node : store.list<Node>()) {
        if (node_eligible(*node, ds)) {
            ++status.desired_number_scheduled;
        }
    }

    for (const Pod* pod : store.owned_by<Pod>(ds.metadata.uid)) {
        if (!is_active_pod(*pod)) {
            continue;
        }
        if (!pod->spec.node_name.empty()) {
            ++status.current_number_scheduled;
        }
        if (pod->is_healthy()) {
            ++status.number_ready;
        }
    }
    return status;
}

void DaemonSetController::sync(TickContext& ctx, DaemonSet& ds) {
    const std::string revision = compute_template_hash(ds.spec.template_);

    std::set<std::string> eligible;
    for (const Node* node : ctx.store.list<Node>()) {
        if (node_eligible(*node, ds)) {
            eligible.insert(node->metadata.name);
        }
    }

    std::set<std::string> covered;
    bool stale_deleted = false;
    for (Pod* pod : ctx.store.owned_by<Pod>(ds.metadata.uid)) {
        if (pod->metadata.is_deleting()) {
            continue;
        }

        const std::string& node_name = pod->spec.required_node;
        std::string reason;
        if (pod->is_terminal()) {
            reason = "pod terminated";
        } else if (!eligible.count(node_name)) {
            reason = "node " + node_name + " is no longer eligible";
        } else if (covered.count(node_name)) {
            reason = "duplicate pod on node " + node_name;
        } else {
            auto label = pod->metadata.labels.find(REVISION_LABEL);
            // 模板变更时每个tick替换一个Pod
            if (!stale_deleted && (label == pod->metadata.labels.end() || label->second != revision)) {
                reason = "update to revision " + revision;
                stale_deleted = true;
            }
        }

        if (!reason.empty()) {
            mark_pod_deleting(*pod, ctx.tick);
            ctx.normal(ResourceKind::DaemonSet, ds.metadata.name, "SuccessfulDelete",
                       "Deleted pod " + pod->metadata.name + " (" + reason + ")");
            continue;
        }
        covered.insert(node_name);
    }

    for (const auto& node_name : eligible) {
        if (covered.count(node_name)) {
            continue;
        }

        std::string pod_name = ds.metadata.name + "-" + node_name;
        const Pod* existing = ctx.store.get<Pod>(pod_name, ds.metadata.namespace_);
        if (existing && !existing->metadata.is_owned_by(ds.metadata.uid)) {
            report_conflict(ctx, ds, pod_name);
            continue;
        }
        if (existing) {
            spdlog::debug("[DaemonSetController] {} waiting for {} to terminate", ds.metadata.name, pod_name);
            continue;
        }

        PodTemplate tmpl = ds.spec.template_;
        tmpl.labels[REVISION_LABEL] = revision;
        tmpl.spec.required_node = node_name;
        create_pod_from_template(ctx, tmpl, pod_name, ds.metadata.namespace_, owner_reference_for(ds));
    }
}

void DaemonSetController::report_conflict(TickContext& ctx, const DaemonSet& ds, const std::string& pod_name) {
    std::string key = ds.metadata.uid + "/" + pod_name;
    conflicts_.insert(key);
    if (reported_conflicts_.count(key)) {
        return;
    }
    ctx.warning(ResourceKind::DaemonSet, ds.metadata.name, "FailedCreate",
                "pod " + pod_name + " already exists and is not owned by DaemonSet " + ds.metadata.name);
}

void DaemonSetController::reconcile(TickContext& ctx) {
    conflicts_.clear();
    for (DaemonSet* ds : ctx.store.list<DaemonSet>()) {
        if (ds->metadata.is_deleting()) {
            for (Pod* pod : ctx.store.owned_by<Pod>(ds->metadata.uid)) {
                mark_pod_deleting(*pod, ctx.tick);
            }
            continue;
        }
        sync(ctx, *ds);
    }
    // 仅在冲突首次出现时告警
    reported_conflicts_.swap(conflicts_);
}

} // namespace kubesim
