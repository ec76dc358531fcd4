#include "controller/scheduler.h"
#include "api/labels.h"
#include <sstream>
#include <spdlog/spdlog.h>

namespace kubesim {

namespace {

// 原因不变时不重复记录
void report_unschedulable(TickContext& ctx, Pod& pod, const std::string& message) {
    if (pod.status.reason != "Unschedulable" || pod.status.message != message) {
        pod.status.reason = "Unschedulable";
        pod.status.message = message;
        ctx.warning(ResourceKind::Pod, pod.metadata.name, "FailedScheduling", message);
    }
}

} // namespace

std::optional<std::string> Scheduler::unbound_claim(const ClusterStore& store, const Pod& pod) {
    for (const auto& claim_name : pod.spec.claim_names) {
        const PersistentVolumeClaim* claim = store.get<PersistentVolumeClaim>(claim_name, pod.metadata.namespace_);
        if (!claim || claim->metadata.is_deleting()) {
            return "persistentvolumeclaim \"" + claim_name + "\" not found";
        }
        if (claim->status.phase != ClaimPhase::Bound) {
            return "persistentvolumeclaim \"" + claim_name + "\" not bound";
        }
    }
    return std::nullopt;
}

NodeFitResult Scheduler::check_node(const Node& node, const Pod& pod) {
    if (node.metadata.is_deleting()) {
        return NodeFitResult::Deleting;
    }
    if (!pod.spec.required_node.empty() && pod.spec.required_node != node.metadata.name) {
        return NodeFitResult::NodeMismatch;
    }
    if (!node.status.ready) {
        return NodeFitResult::NotReady;
    }
    if (node.spec.unschedulable) {
        return NodeFitResult::Unschedulable;
    }
    if (!taints_tolerated(node.spec.taints, pod.spec.tolerations,
                          {TaintEffect::NoSchedule, TaintEffect::NoExecute})) {
        return NodeFitResult::UntoleratedTaint;
    }
    if (node.status.allocated_pods >= node.spec.capacity_pods) {
        return NodeFitResult::InsufficientCapacity;
    }
    return NodeFitResult::Fit;
}

void Scheduler::recompute_allocation(ClusterStore& store) {
    std::unordered_map<std::string, int32_t> counts;
    for (const Pod* pod : store.list<Pod>()) {
        if (!pod->spec.node_name.empty() && is_active_pod(*pod)) {
            ++counts[pod->spec.node_name];
        }
    }

    for (Node* node : store.list<Node>()) {
        auto it = counts.find(node->metadata.name);
        node->status.allocated_pods = it == counts.end() ? 0 : it->second;
    }
}

Node* Scheduler::select_node(const std::vector<Node*>& nodes, const Pod& pod,
                                   std::map<NodeFitResult, int>& rejections) const {
    Node* fallback = nullptr;
    for (Node* node : nodes) {
        NodeFitResult fit = check_node(*node, pod);
        if (fit != NodeFitResult::Fit) {
            ++rejections[fit];
            continue;
        }

        // PreferNoSchedule 的节点只作为后备
        if (!taints_tolerated(node->spec.taints, pod.spec.tolerations, {TaintEffect::PreferNoSchedule})) {
            if (!fallback) {
                fallback = node;
            }
            continue;
        }
        return node;
    }
    return fallback;
}

void Scheduler::reconcile(TickContext& ctx) {
    recompute_allocation(ctx.store);

    std::vector<Node*> nodes = ctx.store.list<Node>();
    int live_nodes = 0;
    for (const Node* node : nodes) {
        if (!node->metadata.is_deleting()) {
            ++live_nodes;
        }
    }

    int scheduled = 0;
    for (Pod* pod : ctx.store.list<Pod>()) {
        if (!pod->spec.node_name.empty() || !is_active_pod(*pod)) {
            continue;
        }

        if (auto message = unbound_claim(ctx.store, *pod)) {
            report_unschedulable(ctx, *pod, *message);
            continue;
        }

        std::map<NodeFitResult, int> rejections;
        Node* target = select_node(nodes, *pod, rejections);

        if (!target) {
            std::ostringstream oss;
            oss << "0/" << live_nodes << " nodes are available";
            bool first = true;
            for (const auto& [result, count] : rejections) {
                if (result == NodeFitResult::Deleting) {
                    continue;
                }
                oss << (first ? ": " : ", ") << count << " " << fit_result_to_string(result);
                first = false;
            }
            oss << ".";
            report_unschedulable(ctx, *pod, oss.str());
            continue;
        }

        pod->spec.node_name = target->metadata.name;
        pod->status.start_tick = ctx.tick;
        if (pod->status.reason == "Unschedulable") {
            pod->status.reason.clear();
            pod->status.message.clear();
        }
        ++target->status.allocated_pods;
        ++scheduled;

        ctx.normal(ResourceKind::Pod, pod->metadata.name, "Scheduled",
                   "Successfully assigned " + pod->metadata.namespace_ + "/" + pod->metadata.name +
                   " to " + target->metadata.name);
    }

    if (scheduled > 0) {
        spdlog::debug("[Scheduler] tick {}: placed {} pod(s)", ctx.tick, scheduled);
    }
}

std::string fit_result_to_string(NodeFitResult result) {
    switch (result) {
        case NodeFitResult::Fit: return "node(s) fit";
        case NodeFitResult::NotReady: return "node(s) were not ready";
        case NodeFitResult::Unschedulable: return "node(s) were unschedulable";
        case NodeFitResult::Deleting: return "node(s) were being deleted";
        case NodeFitResult::InsufficientCapacity: return "node(s) had too many pods";
        case NodeFitResult::UntoleratedTaint: return "node(s) had untolerated taint";
        case NodeFitResult::NodeMismatch: return "node(s) didn't match the required node";
        default: return "node(s) were rejected";
    }
}

} // namespace kubesim
