#include "controller/status_controller.h"
#include "controller/scheduler.h"
#include "controller/replicaset_controller.h"
#include "controller/deployment_controller.h"
#include "controller/statefulset_controller.h"
#include "controller/daemonset_controller.h"
#include "controller/job_controller.h"
#include "controller/disruption_controller.h"
#include "api/labels.h"
#include <algorithm>
#include <set>
#include <sstream>

namespace kubesim {

std::vector<std::string> StatusController::compute_endpoints(ClusterStore& store, const Service& service) {
    std::vector<std::string> endpoints;
    for (const Pod* pod : store.list<Pod>()) {
        if (pod->metadata.namespace_ == service.metadata.namespace_ && pod->is_healthy() &&
            selector_matches(service.spec.selector, pod->metadata.labels)) {
            endpoints.push_back(pod->metadata.name);
        }
    }
    return endpoints;
}

void StatusController::update_endpoints(TickContext& ctx, Service& service) {
    std::vector<std::string> endpoints = compute_endpoints(ctx.store, service);
    const auto& previous = service.status.endpoints;

    for (const auto& name : endpoints) {
        if (std::find(previous.begin(), previous.end(), name) == previous.end()) {
            ctx.normal(ResourceKind::Service, service.metadata.name, "EndpointAdded", "Added endpoint " + name);
        }
    }
    for (const auto& name : previous) {
        if (std::find(endpoints.begin(), endpoints.end(), name) == endpoints.end()) {
            ctx.normal(ResourceKind::Service, service.metadata.name, "EndpointRemoved", "Removed endpoint " + name);
        }
    }

    service.status.endpoints = std::move(endpoints);
}

void StatusController::reconcile(TickContext& ctx) {
    ClusterStore& store = ctx.store;

    for (ReplicaSet* rs : store.list<ReplicaSet>()) {
        rs->status = ReplicaSetController::compute_status(store, *rs);
    }
    for (Deployment* deployment : store.list<Deployment>()) {
        deployment->status = DeploymentController::compute_status(store, *deployment);
    }
    for (StatefulSet* sts : store.list<StatefulSet>()) {
        sts->status = StatefulSetController::compute_status(store, *sts);
    }
    for (DaemonSet* ds : store.list<DaemonSet>()) {
        ds->status = DaemonSetController::compute_status(store, *ds);
    }
    for (Job* job : store.list<Job>()) {
        job->status.active = JobController::count_active(store, *job);
    }
    for (Service* service : store.list<Service>()) {
        if (!service->metadata.is_deleting()) {
            update_endpoints(ctx, *service);
        }
    }
    for (PodDisruptionBudget* pdb : store.list<PodDisruptionBudget>()) {
        pdb->status = DisruptionController::compute_status(store, *pdb);
    }

    Scheduler::recompute_allocation(store);
}

void InvariantChecker::check_nodes(const ClusterStore& store) {
    std::map<std::string, int32_t> counts;
    for (const Pod* pod : store.list<Pod>()) {
        if (!pod->spec.node_name.empty() && is_active_pod(*pod)) {
            ++counts[pod->spec.node_name];
        }
    }

    for (const auto& [node_name, count] : counts) {
        const Node* node = store.get<Node>(node_name, "");
        if (!node) {
            throw InvariantViolation("active pods bound to missing node " + node_name);
        }
        if (count > node->spec.capacity_pods) {
            std::ostringstream oss;
            oss << "node " << node_name << " has " << count << " pods, capacity " << node->spec.capacity_pods;
            throw InvariantViolation(oss.str());
        }
    }
}

namespace {

bool owner_exists(const ClusterStore& store, const OwnerReference& owner) {
    switch (owner.kind) {
        case ResourceKind::ReplicaSet: return store.table<ReplicaSet>().find_by_uid(owner.uid) != nullptr;
        case ResourceKind::Deployment: return store.table<Deployment>().find_by_uid(owner.uid) != nullptr;
        case ResourceKind::StatefulSet: return store.table<StatefulSet>().find_by_uid(owner.uid) != nullptr;
        case ResourceKind::DaemonSet: return store.table<DaemonSet>().find_by_uid(owner.uid) != nullptr;
        case ResourceKind::Job: return store.table<Job>().find_by_uid(owner.uid) != nullptr;
        case ResourceKind::CronJob: return store.table<CronJob>().find_by_uid(owner.uid) != nullptr;
        default: return false;
    }
}

template<typename T>
void check_owned(const ClusterStore& store) {
    for (const T* obj : store.list<T>()) {
        const auto& owner = obj->metadata.owner_reference;
        if (owner && !owner_exists(store, *owner)) {
            throw InvariantViolation(kind_to_string(T::KIND) + " " + obj->metadata.name +
                                     " references missing owner " + owner->name);
        }
    }
}

} // namespace

void InvariantChecker::check_owners(const ClusterStore& store) {
    check_owned<Pod>(store);
    check_owned<ReplicaSet>(store);
    check_owned<Job>(store);
}

void InvariantChecker::check_stateful_sets(const ClusterStore& store) {
    std::set<std::pair<std::string, int32_t>> seen;
    for (const Pod* pod : store.list<Pod>()) {
        const auto& owner = pod->metadata.owner_reference;
        if (!owner || owner->kind != ResourceKind::StatefulSet || !pod->spec.ordinal) {
            continue;
        }
        if (pod->metadata.is_deleting() || pod->is_terminal()) {
            continue;
        }
        if (!seen.emplace(owner->uid, *pod->spec.ordinal).second) {
            throw InvariantViolation("statefulset " + owner->name + " has two live pods with ordinal " +
                                     std::to_string(*pod->spec.ordinal));
        }
    }
}

void InvariantChecker::check_jobs(const ClusterStore& store) {
    for (const Job* job : store.list<Job>()) {
        int32_t active = 0;
        for (const Pod* pod : store.list<Pod>()) {
            if (pod->metadata.is_owned_by(job->metadata.uid) && is_active_pod(*pod)) {
                ++active;
            }
        }
        if (active > job->spec.parallelism) {
            throw InvariantViolation("job " + job->metadata.name + " has " + std::to_string(active) +
                                     " active pods, parallelism " + std::to_string(job->spec.parallelism));
        }
    }
}

void InvariantChecker::check(const ClusterStore& store) {
    check_nodes(store);
    check_owners(store);
    check_stateful_sets(store);
    check_jobs(store);
}

void InvariantChecker::reconcile(TickContext& ctx) {
    check(ctx.store);
}

} // namespace kubesim
