#include "controller/node_lifecycle.h"
#include "api/labels.h"
#include <spdlog/spdlog.h>

namespace kubesim {

void NodeLifecycle::reconcile(TickContext& ctx) {
    int evicted = 0;
    for (Pod* pod : ctx.store.list<Pod>()) {
        if (pod->spec.node_name.empty() || !is_active_pod(*pod)) {
            continue;
        }

        const Node* node = ctx.store.get<Node>(pod->spec.node_name, "");
        std::string reason;
        std::string message;
        if (!node || node->metadata.is_deleting() || !node->status.ready) {
            reason = "NodeNotReady";
            message = "Node " + pod->spec.node_name + " is not ready";
        } else if (!taints_tolerated(node->spec.taints, pod->spec.tolerations, {TaintEffect::NoExecute})) {
            reason = "TaintEviction";
            message = "Node " + pod->spec.node_name + " has a NoExecute taint the pod does not tolerate";
        } else {
            continue;
        }

        pod->status.phase = PodPhase::Failed;
        pod->status.ready = false;
        pod->status.reason = reason;
        pod->status.message = message;
        mark_pod_deleting(*pod, ctx.tick);
        ++evicted;

        ctx.warning(ResourceKind::Pod, pod->metadata.name, reason, message);
    }

    if (evicted > 0) {
        spdlog::debug("[NodeLifecycle] tick {}: evicted {} pod(s)", ctx.tick, evicted);
    }
}

} // namespace kubesim
