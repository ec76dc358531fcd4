#include "engine/simulator.h"
#include "engine/validation.h"
#include "controller/garbage_collector.h"
#include "controller/storage_controller.h"
#include "controller/scheduler.h"
#include "controller/pod_lifecycle.h"
#include "controller/node_lifecycle.h"
#include "controller/deployment_controller.h"
#include "controller/replicaset_controller.h"
#include "controller/statefulset_controller.h"
#include "controller/daemonset_controller.h"
#include "controller/cronjob_controller.h"
#include "controller/job_controller.h"
#include "controller/hpa_controller.h"
#include "controller/status_controller.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace kubesim {

namespace {

// 节点、StorageClass和PV不属于任何命名空间
template<typename T>
std::string namespace_for(const std::string& namespace_) {
    if constexpr (T::KIND == ResourceKind::Node || T::KIND == ResourceKind::StorageClass ||
                  T::KIND == ResourceKind::PersistentVolume) {
        return "";
    } else {
        return namespace_.empty() ? "default" : namespace_;
    }
}

// 创建时清空由控制器维护的状态
template<typename T>
void reset_status(T& obj, Tick) {
    obj.status = decltype(obj.status)();
}

void reset_status(StorageClass&, Tick) {}

void reset_status(Node& node, Tick) {
    node.status.allocated_pods = 0;
}

void reset_status(Pod& pod, Tick tick) {
    pod.status = PodStatus();
    pod.status.start_tick = tick;
}

// 更新时保留身份、属主和状态，只替换期望状态
template<typename T>
void apply_update(T& existing, const T& incoming) {
    existing.metadata.labels = incoming.metadata.labels;
    existing.metadata.annotations = incoming.metadata.annotations;
    existing.spec = incoming.spec;
}

void apply_update(Pod& existing, const Pod& incoming) {
    std::string node_name = existing.spec.node_name;
    std::string required_node = existing.spec.required_node;
    std::optional<int32_t> ordinal = existing.spec.ordinal;

    existing.metadata.labels = incoming.metadata.labels;
    existing.metadata.annotations = incoming.metadata.annotations;
    existing.spec = incoming.spec;
    existing.spec.node_name = node_name;
    existing.spec.required_node = required_node;
    existing.spec.ordinal = ordinal;
}

// 绑定关系由存储控制器维护
void apply_update(PersistentVolume& existing, const PersistentVolume& incoming) {
    std::optional<ClaimReference> claim_ref = existing.spec.claim_ref;

    existing.metadata.labels = incoming.metadata.labels;
    existing.metadata.annotations = incoming.metadata.annotations;
    existing.spec = incoming.spec;
    existing.spec.claim_ref = claim_ref;
}

template<typename T>
void mark_removed(T& obj, Tick tick) {
    mark_deleting(obj.metadata, tick);
}

void mark_removed(Pod& pod, Tick tick) {
    mark_pod_deleting(pod, tick);
}

template<typename T>
nlohmann::json dump_table(const ClusterStore& store) {
    nlohmann::json items = nlohmann::json::array();
    for (const T* obj : store.list<T>()) {
        nlohmann::json j;
        obj->to_json(j);
        items.push_back(j);
    }
    return items;
}

int32_t active_pods_on(const ClusterStore& store, const std::string& node) {
    int32_t count = 0;
    for (const Pod* pod : store.list<Pod>()) {
        if (pod->spec.node_name == node && is_active_pod(*pod)) {
            ++count;
        }
    }
    return count;
}

} // namespace

Simulator::Simulator(const SimulatorConfig& config)
    : config_(config), recorder_(config.event_log_capacity), tick_(0), lifecycle_(nullptr) {
    spdlog::set_level(spdlog::level::from_str(config_.log_level));

    auto lifecycle = std::make_unique<PodLifecycle>();
    lifecycle_ = lifecycle.get();

    // 固定的调和顺序
    pipeline_.push_back(std::make_unique<GarbageCollector>());
    pipeline_.push_back(std::make_unique<StorageController>());
    pipeline_.push_back(std::make_unique<Scheduler>());
    pipeline_.push_back(std::move(lifecycle));
    pipeline_.push_back(std::make_unique<NodeLifecycle>());
    pipeline_.push_back(std::make_unique<DeploymentController>());
    pipeline_.push_back(std::make_unique<ReplicaSetController>());
    pipeline_.push_back(std::make_unique<StatefulSetController>());
    pipeline_.push_back(std::make_unique<DaemonSetController>());
    pipeline_.push_back(std::make_unique<CronJobController>());
    pipeline_.push_back(std::make_unique<JobController>());
    pipeline_.push_back(std::make_unique<HpaController>());
    pipeline_.push_back(std::make_unique<StatusController>());
    pipeline_.push_back(std::make_unique<InvariantChecker>());

    const auto& pool = config_.node_pool;
    for (int32_t i = 0; i < pool.count; ++i) {
        Node node(pool.name_prefix + "-" + std::to_string(i + 1), pool.capacity_pods);
        auto response = create(node);
        if (!response.ok()) {
            throw std::invalid_argument("invalid node pool: " + response.message);
        }
    }
}

Simulator::~Simulator() = default;

TickContext Simulator::context() {
    return TickContext(store_, recorder_, config_, tick_);
}

template<typename T>
ApiResponse<T> Simulator::validated(const T& obj) const {
    if (auto error = validate(obj)) {
        return ApiResponse<T>::error(ApiStatus::Invalid, *error);
    }
    return ApiResponse<T>::success(obj);
}

template<typename T>
ApiResponse<T> Simulator::create(const T& obj) {
    T candidate = obj;
    candidate.metadata.namespace_ = namespace_for<T>(obj.metadata.namespace_);

    auto check = validated(candidate);
    if (!check.ok()) {
        return check;
    }

    if (store_.table<T>().contains(candidate.metadata.name, candidate.metadata.namespace_)) {
        return ApiResponse<T>::error(ApiStatus::AlreadyExists,
                                     kind_to_string(T::KIND) + " " + candidate.metadata.name + " already exists");
    }

    if constexpr (T::KIND == ResourceKind::Pod) {
        if (!candidate.spec.node_name.empty()) {
            const Node* node = store_.get<Node>(candidate.spec.node_name, "");
            if (!node || node->metadata.is_deleting()) {
                return ApiResponse<T>::error(ApiStatus::Invalid, "node " + candidate.spec.node_name + " not found");
            }
            if (active_pods_on(store_, node->metadata.name) >= node->spec.capacity_pods) {
                return ApiResponse<T>::error(ApiStatus::Invalid, "node " + candidate.spec.node_name + " is full");
            }
        }
    }

    candidate.metadata.owner_reference.reset();
    reset_status(candidate, tick_);

    T& stored = store_.add(std::move(candidate), tick_);
    if constexpr (T::KIND == ResourceKind::Pod) {
        if (!stored.spec.node_name.empty()) {
            Scheduler::recompute_allocation(store_);
        }
    }

    spdlog::debug("[Simulator] created {} {}", kind_to_string(T::KIND), stored.metadata.name);
    return ApiResponse<T>::success(stored, kind_to_string(T::KIND) + " created");
}

template<typename T>
ApiResponse<T> Simulator::update(const T& obj) {
    std::string ns = namespace_for<T>(obj.metadata.namespace_);
    T* existing = store_.get<T>(obj.metadata.name, ns);
    if (!existing) {
        return ApiResponse<T>::error(ApiStatus::NotFound, kind_to_string(T::KIND) + " " + obj.metadata.name + " not found");
    }
    if (existing->metadata.is_deleting()) {
        return ApiResponse<T>::error(ApiStatus::Invalid, kind_to_string(T::KIND) + " " + obj.metadata.name +
                                     " is being deleted");
    }

    T candidate = *existing;
    apply_update(candidate, obj);

    auto check = validated(candidate);
    if (!check.ok()) {
        return check;
    }

    if constexpr (T::KIND == ResourceKind::Node) {
        int32_t active = active_pods_on(store_, candidate.metadata.name);
        if (candidate.spec.capacity_pods < active) {
            return ApiResponse<T>::error(ApiStatus::Invalid, "capacity " + std::to_string(candidate.spec.capacity_pods) +
                                         " is below the " + std::to_string(active) + " pods on the node");
        }
    }

    *existing = std::move(candidate);
    return ApiResponse<T>::success(*existing, kind_to_string(T::KIND) + " updated");
}

template<typename T>
ApiResponse<T> Simulator::remove(const std::string& name, const std::string& namespace_) {
    T* existing = store_.get<T>(name, namespace_for<T>(namespace_));
    if (!existing) {
        return ApiResponse<T>::error(ApiStatus::NotFound, kind_to_string(T::KIND) + " " + name + " not found");
    }

    mark_removed(*existing, tick_);
    return ApiResponse<T>::success(*existing, kind_to_string(T::KIND) + " marked for deletion");
}

template<typename T>
std::optional<T> Simulator::get(const std::string& name, const std::string& namespace_) const {
    const T* obj = store_.get<T>(name, namespace_for<T>(namespace_));
    if (obj) {
        return *obj;
    }
    return std::nullopt;
}

template<typename T>
std::vector<T> Simulator::list(const std::string& namespace_) const {
    std::vector<T> result;
    for (const T* obj : store_.list<T>()) {
        if (namespace_.empty() || obj->metadata.namespace_ == namespace_) {
            result.push_back(*obj);
        }
    }
    return result;
}

template<typename T>
ApiResponse<T> Simulator::scale(const std::string& name, int32_t replicas, const std::string& namespace_) {
    if (replicas < 0) {
        return ApiResponse<T>::error(ApiStatus::Invalid, "replicas must not be negative");
    }
    auto existing = get<T>(name, namespace_);
    if (!existing) {
        return ApiResponse<T>::error(ApiStatus::NotFound, kind_to_string(T::KIND) + " " + name + " not found");
    }
    existing->spec.replicas = replicas;
    return update(*existing);
}

ApiResponse<Deployment> Simulator::set_image(const std::string& deployment, const std::string& image,
                                             const std::string& namespace_) {
    auto existing = get<Deployment>(deployment, namespace_);
    if (!existing) {
        return ApiResponse<Deployment>::error(ApiStatus::NotFound, "Deployment " + deployment + " not found");
    }
    existing->spec.template_.spec.image = image;
    return update(*existing);
}

ApiResponse<Deployment> Simulator::rollout_undo(const std::string& deployment, const std::string& namespace_) {
    Deployment* existing = store_.get<Deployment>(deployment, namespace_for<Deployment>(namespace_));
    if (!existing || existing->metadata.is_deleting()) {
        return ApiResponse<Deployment>::error(ApiStatus::NotFound, "Deployment " + deployment + " not found");
    }

    auto previous = DeploymentController::previous_template(store_, *existing);
    if (!previous) {
        return ApiResponse<Deployment>::error(ApiStatus::Invalid, "no previous revision for deployment " + deployment);
    }

    existing->spec.template_ = *previous;
    recorder_.record(tick_, EventType::Normal, "DeploymentRollback", ResourceKind::Deployment, deployment,
                     "Rolled back deployment " + deployment + " to image " + previous->spec.image);
    return ApiResponse<Deployment>::success(*existing, "rolled back");
}

ApiResponse<Node> Simulator::cordon(const std::string& node) {
    Node* existing = store_.get<Node>(node, "");
    if (!existing) {
        return ApiResponse<Node>::error(ApiStatus::NotFound, "Node " + node + " not found");
    }
    if (!existing->spec.unschedulable) {
        existing->spec.unschedulable = true;
        recorder_.record(tick_, EventType::Normal, "NodeNotSchedulable", ResourceKind::Node, node,
                         "Node " + node + " status is now: NodeNotSchedulable");
    }
    return ApiResponse<Node>::success(*existing, "cordoned");
}

ApiResponse<Node> Simulator::uncordon(const std::string& node) {
    Node* existing = store_.get<Node>(node, "");
    if (!existing) {
        return ApiResponse<Node>::error(ApiStatus::NotFound, "Node " + node + " not found");
    }
    if (existing->spec.unschedulable) {
        existing->spec.unschedulable = false;
        recorder_.record(tick_, EventType::Normal, "NodeSchedulable", ResourceKind::Node, node,
                         "Node " + node + " status is now: NodeSchedulable");
    }
    return ApiResponse<Node>::success(*existing, "uncordoned");
}

ApiResponse<Node> Simulator::set_node_ready(const std::string& node, bool ready) {
    Node* existing = store_.get<Node>(node, "");
    if (!existing) {
        return ApiResponse<Node>::error(ApiStatus::NotFound, "Node " + node + " not found");
    }
    if (existing->status.ready != ready) {
        existing->status.ready = ready;
        recorder_.record(tick_, ready ? EventType::Normal : EventType::Warning, ready ? "NodeReady" : "NodeNotReady",
                         ResourceKind::Node, node, "Node " + node + " status is now: " + (ready ? "NodeReady" : "NodeNotReady"));
    }
    return ApiResponse<Node>::success(*existing);
}

ApiResponse<Node> Simulator::add_taint(const std::string& node, const Taint& taint) {
    Node* existing = store_.get<Node>(node, "");
    if (!existing) {
        return ApiResponse<Node>::error(ApiStatus::NotFound, "Node " + node + " not found");
    }
    if (taint.key.empty()) {
        return ApiResponse<Node>::error(ApiStatus::Invalid, "taint key is required");
    }

    auto& taints = existing->spec.taints;
    auto it = std::find_if(taints.begin(), taints.end(), [&taint](const Taint& t) {
        return t.key == taint.key && t.effect == taint.effect;
    });
    if (it != taints.end()) {
        it->value = taint.value;
    } else {
        taints.push_back(taint);
    }
    return ApiResponse<Node>::success(*existing, "taint added");
}

ApiResponse<Node> Simulator::remove_taint(const std::string& node, const std::string& key,
                                          std::optional<TaintEffect> effect) {
    Node* existing = store_.get<Node>(node, "");
    if (!existing) {
        return ApiResponse<Node>::error(ApiStatus::NotFound, "Node " + node + " not found");
    }

    auto& taints = existing->spec.taints;
    auto end = std::remove_if(taints.begin(), taints.end(), [&](const Taint& t) {
        return t.key == key && (!effect || t.effect == *effect);
    });
    if (end == taints.end()) {
        return ApiResponse<Node>::error(ApiStatus::NotFound, "taint " + key + " not found on node " + node);
    }
    taints.erase(end, taints.end());
    return ApiResponse<Node>::success(*existing, "taint removed");
}

ApiResponse<Pod> Simulator::set_pod_failure(const std::string& pod, FailureMode mode, const std::string& namespace_) {
    Pod* existing = store_.get<Pod>(pod, namespace_for<Pod>(namespace_));
    if (!existing) {
        return ApiResponse<Pod>::error(ApiStatus::NotFound, "Pod " + pod + " not found");
    }
    existing->spec.failure_mode = mode;
    return ApiResponse<Pod>::success(*existing);
}

void Simulator::add_failure_rule(const std::string& image, FailureMode mode) {
    lifecycle_->add_failure_rule(image, mode);
}

bool Simulator::remove_failure_rule(const std::string& image) {
    return lifecycle_->remove_failure_rule(image);
}

ApiResponse<Pod> Simulator::report_cpu(const std::string& pod, double percent, const std::string& namespace_) {
    if (percent < 0.0) {
        return ApiResponse<Pod>::error(ApiStatus::Invalid, "CPU utilization must not be negative");
    }
    Pod* existing = store_.get<Pod>(pod, namespace_for<Pod>(namespace_));
    if (!existing) {
        return ApiResponse<Pod>::error(ApiStatus::NotFound, "Pod " + pod + " not found");
    }
    existing->status.cpu_utilization = percent;
    return ApiResponse<Pod>::success(*existing);
}

ApiResponse<EvictionResult> Simulator::evict_pod(const std::string& pod, const std::string& namespace_) {
    Pod* existing = store_.get<Pod>(pod, namespace_for<Pod>(namespace_));
    if (!existing) {
        return ApiResponse<EvictionResult>::error(ApiStatus::NotFound, "Pod " + pod + " not found");
    }

    TickContext ctx = context();
    DisruptionController::EvictionSet evicted;
    EvictionResult result = disruption_.evict(ctx, *existing, evicted);

    auto response = ApiResponse<EvictionResult>::success(result, result.message);
    if (!result.evicted) {
        response.status = ApiStatus::Failure;
    }
    return response;
}

ApiResponse<DrainResult> Simulator::drain_node(const std::string& node) {
    Node* existing = store_.get<Node>(node, "");
    if (!existing) {
        return ApiResponse<DrainResult>::error(ApiStatus::NotFound, "Node " + node + " not found");
    }

    TickContext ctx = context();
    DrainResult result = disruption_.drain(ctx, *existing);

    auto response = ApiResponse<DrainResult>::success(result);
    if (!result.complete()) {
        response.status = ApiStatus::Failure;
        response.message = std::to_string(result.blocked.size()) + " pod(s) could not be evicted";
    }
    return response;
}

void Simulator::tick() {
    ++tick_;
    TickContext ctx = context();
    for (auto& controller : pipeline_) {
        controller->reconcile(ctx);
    }
    spdlog::debug("[Simulator] tick {} done: {} objects, {} events", tick_, store_.total_objects(),
                  recorder_.events().size());
}

void Simulator::run(int ticks) {
    for (int i = 0; i < ticks; ++i) {
        tick();
    }
}

std::vector<std::string> Simulator::service_endpoints(const std::string& service, const std::string& namespace_) const {
    const Service* existing = store_.get<Service>(service, namespace_for<Service>(namespace_));
    if (!existing) {
        return {};
    }
    return existing->status.endpoints;
}

nlohmann::json Simulator::snapshot() const {
    nlohmann::json j = {{"tick", tick_}};
    j["nodes"] = dump_table<Node>(store_);
    j["pods"] = dump_table<Pod>(store_);
    j["replicaSets"] = dump_table<ReplicaSet>(store_);
    j["deployments"] = dump_table<Deployment>(store_);
    j["statefulSets"] = dump_table<StatefulSet>(store_);
    j["daemonSets"] = dump_table<DaemonSet>(store_);
    j["jobs"] = dump_table<Job>(store_);
    j["cronJobs"] = dump_table<CronJob>(store_);
    j["horizontalPodAutoscalers"] = dump_table<HorizontalPodAutoscaler>(store_);
    j["podDisruptionBudgets"] = dump_table<PodDisruptionBudget>(store_);
    j["services"] = dump_table<Service>(store_);
    j["storageClasses"] = dump_table<StorageClass>(store_);
    j["persistentVolumes"] = dump_table<PersistentVolume>(store_);
    j["persistentVolumeClaims"] = dump_table<PersistentVolumeClaim>(store_);

    j["events"] = nlohmann::json::array();
    for (const auto& event : recorder_.events()) {
        nlohmann::json event_json;
        event.to_json(event_json);
        j["events"].push_back(event_json);
    }
    return j;
}

void Simulator::check_invariants() const {
    InvariantChecker::check(store_);
}

// 显式实例化
#define KUBESIM_INSTANTIATE_SIMULATOR(T)                                                        \
    template ApiResponse<T> Simulator::create<T>(const T& obj);                                 \
    template ApiResponse<T> Simulator::update<T>(const T& obj);                                 \
    template ApiResponse<T> Simulator::remove<T>(const std::string& name, const std::string& namespace_); \
    template std::optional<T> Simulator::get<T>(const std::string& name, const std::string& namespace_) const; \
    template std::vector<T> Simulator::list<T>(const std::string& namespace_) const;

KUBESIM_INSTANTIATE_SIMULATOR(Node)
KUBESIM_INSTANTIATE_SIMULATOR(Pod)
KUBESIM_INSTANTIATE_SIMULATOR(ReplicaSet)
KUBESIM_INSTANTIATE_SIMULATOR(Deployment)
KUBESIM_INSTANTIATE_SIMULATOR(StatefulSet)
KUBESIM_INSTANTIATE_SIMULATOR(DaemonSet)
KUBESIM_INSTANTIATE_SIMULATOR(Job)
KUBESIM_INSTANTIATE_SIMULATOR(CronJob)
KUBESIM_INSTANTIATE_SIMULATOR(HorizontalPodAutoscaler)
KUBESIM_INSTANTIATE_SIMULATOR(PodDisruptionBudget)
KUBESIM_INSTANTIATE_SIMULATOR(Service)
KUBESIM_INSTANTIATE_SIMULATOR(StorageClass)
KUBESIM_INSTANTIATE_SIMULATOR(PersistentVolume)
KUBESIM_INSTANTIATE_SIMULATOR(PersistentVolumeClaim)

#undef KUBESIM_INSTANTIATE_SIMULATOR

template ApiResponse<ReplicaSet> Simulator::scale<ReplicaSet>(const std::string&, int32_t, const std::string&);
template ApiResponse<Deployment> Simulator::scale<Deployment>(const std::string&, int32_t, const std::string&);
template ApiResponse<StatefulSet> Simulator::scale<StatefulSet>(const std::string&, int32_t, const std::string&);

} // namespace kubesim
