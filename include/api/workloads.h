#pragma once

#include "api/types.h"

namespace kubesim {

// ---------------------------------------------------------------------------
// ReplicaSet
// ---------------------------------------------------------------------------

class ReplicaSetSpec {
public:
    int32_t replicas;
    Labels selector;
    PodTemplate template_;

    ReplicaSetSpec() : replicas(1) {}

    void to_json(nlohmann::json& j) const;
};

class ReplicaSetStatus {
public:
    int32_t replicas;
    int32_t ready_replicas;
    int32_t available_replicas;

    ReplicaSetStatus() : replicas(0), ready_replicas(0), available_replicas(0) {}

    void to_json(nlohmann::json& j) const;
};

class ReplicaSet {
public:
    static constexpr ResourceKind KIND = ResourceKind::ReplicaSet;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    ReplicaSetSpec spec;
    ReplicaSetStatus status;

    ReplicaSet() : api_version("apps/v1"), kind("ReplicaSet") {}
    ReplicaSet(const std::string& name, const std::string& ns = "default")
        : api_version("apps/v1"), kind("ReplicaSet"), metadata(name, ns) {}

    // 模板哈希标签，非Deployment生成的RS为空
    std::string template_hash() const;

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// Deployment
// ---------------------------------------------------------------------------

enum class DeploymentStrategyType {
    RollingUpdate,
    Recreate
};

struct DeploymentStrategy {
    DeploymentStrategyType type;
    int32_t max_surge;
    int32_t max_unavailable;

    DeploymentStrategy() : type(DeploymentStrategyType::RollingUpdate), max_surge(1), max_unavailable(1) {}
};

class DeploymentSpec {
public:
    int32_t replicas;
    Labels selector;
    PodTemplate template_;
    DeploymentStrategy strategy;
    // 滚动完成后保留的旧RS数量
    int32_t revision_history_limit;

    DeploymentSpec() : replicas(1), revision_history_limit(1) {}

    void to_json(nlohmann::json& j) const;
};

class DeploymentStatus {
public:
    int32_t replicas;
    int32_t updated_replicas;
    int32_t ready_replicas;
    int32_t available_replicas;
    std::string condition;
    std::string condition_reason;
    std::string current_hash;

    DeploymentStatus()
        : replicas(0), updated_replicas(0), ready_replicas(0), available_replicas(0),
          condition("Progressing"), condition_reason("NewReplicaSetCreated") {}

    void to_json(nlohmann::json& j) const;
};

class Deployment {
public:
    static constexpr ResourceKind KIND = ResourceKind::Deployment;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    DeploymentSpec spec;
    DeploymentStatus status;

    Deployment() : api_version("apps/v1"), kind("Deployment") {}
    Deployment(const std::string& name, const std::string& ns = "default")
        : api_version("apps/v1"), kind("Deployment"), metadata(name, ns) {}

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// StatefulSet
// ---------------------------------------------------------------------------

class StatefulSetSpec {
public:
    int32_t replicas;
    Labels selector;
    PodTemplate template_;

    StatefulSetSpec() : replicas(1) {}

    void to_json(nlohmann::json& j) const;
};

class StatefulSetStatus {
public:
    int32_t replicas;
    int32_t ready_replicas;
    int32_t current_replicas;
    int32_t updated_replicas;
    std::string update_revision;

    StatefulSetStatus() : replicas(0), ready_replicas(0), current_replicas(0), updated_replicas(0) {}

    void to_json(nlohmann::json& j) const;
};

class StatefulSet {
public:
    static constexpr ResourceKind KIND = ResourceKind::StatefulSet;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    StatefulSetSpec spec;
    StatefulSetStatus status;

    StatefulSet() : api_version("apps/v1"), kind("StatefulSet") {}
    StatefulSet(const std::string& name, const std::string& ns = "default")
        : api_version("apps/v1"), kind("StatefulSet"), metadata(name, ns) {}

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// DaemonSet
// ---------------------------------------------------------------------------

class DaemonSetSpec {
public:
    Labels selector;
    PodTemplate template_;

    void to_json(nlohmann::json& j) const;
};

class DaemonSetStatus {
public:
    int32_t desired_number_scheduled;
    int32_t current_number_scheduled;
    int32_t number_ready;

    DaemonSetStatus() : desired_number_scheduled(0), current_number_scheduled(0), number_ready(0) {}

    void to_json(nlohmann::json& j) const;
};

class DaemonSet {
public:
    static constexpr ResourceKind KIND = ResourceKind::DaemonSet;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    DaemonSetSpec spec;
    DaemonSetStatus status;

    DaemonSet() : api_version("apps/v1"), kind("DaemonSet") {}
    DaemonSet(const std::string& name, const std::string& ns = "default")
        : api_version("apps/v1"), kind("DaemonSet"), metadata(name, ns) {}

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// Job / CronJob
// ---------------------------------------------------------------------------

class JobSpec {
public:
    int32_t completions;
    int32_t parallelism;
    int32_t backoff_limit;
    // 每个Pod的运行时长，0表示使用全局默认值
    int32_t completion_ticks;
    PodTemplate template_;

    JobSpec() : completions(1), parallelism(1), backoff_limit(6), completion_ticks(0) {}

    void to_json(nlohmann::json& j) const;
};

enum class JobCondition {
    None,
    Complete,
    Failed
};

class JobStatus {
public:
    int32_t succeeded;
    int32_t failed;
    int32_t active;
    std::optional<Tick> start_tick;
    std::optional<Tick> completion_tick;
    JobCondition condition;

    JobStatus() : succeeded(0), failed(0), active(0), condition(JobCondition::None) {}

    bool finished() const { return condition != JobCondition::None; }

    void to_json(nlohmann::json& j) const;
};

class Job {
public:
    static constexpr ResourceKind KIND = ResourceKind::Job;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    JobSpec spec;
    JobStatus status;

    Job() : api_version("batch/v1"), kind("Job") {}
    Job(const std::string& name, const std::string& ns = "default")
        : api_version("batch/v1"), kind("Job"), metadata(name, ns) {}

    void to_json(nlohmann::json& j) const;
};

enum class ConcurrencyPolicy {
    Allow,
    Forbid,
    Replace
};

class CronJobSpec {
public:
    std::string schedule;
    ConcurrencyPolicy concurrency_policy;
    bool suspend;
    int32_t successful_jobs_history_limit;
    int32_t failed_jobs_history_limit;
    JobSpec job_template;

    CronJobSpec()
        : concurrency_policy(ConcurrencyPolicy::Forbid), suspend(false),
          successful_jobs_history_limit(3), failed_jobs_history_limit(1) {}

    void to_json(nlohmann::json& j) const;
};

class CronJobStatus {
public:
    std::optional<Tick> last_schedule_tick;
    int32_t active;

    CronJobStatus() : active(0) {}

    void to_json(nlohmann::json& j) const;
};

class CronJob {
public:
    static constexpr ResourceKind KIND = ResourceKind::CronJob;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    CronJobSpec spec;
    CronJobStatus status;

    CronJob() : api_version("batch/v1"), kind("CronJob") {}
    CronJob(const std::string& name, const std::string& ns = "default")
        : api_version("batch/v1"), kind("CronJob"), metadata(name, ns) {}

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// HorizontalPodAutoscaler
// ---------------------------------------------------------------------------

struct ScaleTargetRef {
    ResourceKind kind;
    std::string name;

    ScaleTargetRef() : kind(ResourceKind::Deployment) {}
    ScaleTargetRef(ResourceKind k, const std::string& n) : kind(k), name(n) {}
};

class HorizontalPodAutoscalerSpec {
public:
    ScaleTargetRef scale_target_ref;
    int32_t min_replicas;
    int32_t max_replicas;
    int32_t target_cpu_utilization;

    HorizontalPodAutoscalerSpec() : min_replicas(1), max_replicas(1), target_cpu_utilization(80) {}

    void to_json(nlohmann::json& j) const;
};

class HorizontalPodAutoscalerStatus {
public:
    int32_t current_replicas;
    int32_t desired_replicas;
    std::optional<double> current_cpu_utilization;
    std::optional<Tick> last_scale_tick;

    HorizontalPodAutoscalerStatus() : current_replicas(0), desired_replicas(0) {}

    void to_json(nlohmann::json& j) const;
};

class HorizontalPodAutoscaler {
public:
    static constexpr ResourceKind KIND = ResourceKind::HorizontalPodAutoscaler;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    HorizontalPodAutoscalerSpec spec;
    HorizontalPodAutoscalerStatus status;

    HorizontalPodAutoscaler() : api_version("autoscaling/v1"), kind("HorizontalPodAutoscaler") {}
    HorizontalPodAutoscaler(const std::string& name, const std::string& ns = "default")
        : api_version("autoscaling/v1"), kind("HorizontalPodAutoscaler"), metadata(name, ns) {}

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// PodDisruptionBudget
// ---------------------------------------------------------------------------

class PodDisruptionBudgetSpec {
public:
    Labels selector;
    std::optional<int32_t> min_available;
    std::optional<int32_t> max_unavailable;

    void to_json(nlohmann::json& j) const;
};

class PodDisruptionBudgetStatus {
public:
    int32_t current_healthy;
    int32_t desired_healthy;
    int32_t expected_pods;
    int32_t disruptions_allowed;

    PodDisruptionBudgetStatus() : current_healthy(0), desired_healthy(0), expected_pods(0), disruptions_allowed(0) {}

    void to_json(nlohmann::json& j) const;
};

class PodDisruptionBudget {
public:
    static constexpr ResourceKind KIND = ResourceKind::PodDisruptionBudget;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    PodDisruptionBudgetSpec spec;
    PodDisruptionBudgetStatus status;

    PodDisruptionBudget() : api_version("policy/v1"), kind("PodDisruptionBudget") {}
    PodDisruptionBudget(const std::string& name, const std::string& ns = "default")
        : api_version("policy/v1"), kind("PodDisruptionBudget"), metadata(name, ns) {}

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// StorageClass / PersistentVolume / PersistentVolumeClaim
// ---------------------------------------------------------------------------

enum class ReclaimPolicy {
    Delete,
    Retain
};

enum class AccessMode {
    ReadWriteOnce,
    ReadOnlyMany,
    ReadWriteMany
};

// 集群级：动态供给卷的模板
class StorageClassSpec {
public:
    std::string provisioner;
    ReclaimPolicy reclaim_policy;

    StorageClassSpec() : reclaim_policy(ReclaimPolicy::Delete) {}

    void to_json(nlohmann::json& j) const;
};

class StorageClass {
public:
    static constexpr ResourceKind KIND = ResourceKind::StorageClass;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    StorageClassSpec spec;

    StorageClass() : api_version("storage.k8s.io/v1"), kind("StorageClass") { metadata.namespace_.clear(); }
    StorageClass(const std::string& name, const std::string& provisioner = "kubesim.io/hostpath")
        : api_version("storage.k8s.io/v1"), kind("StorageClass"), metadata(name, "") {
        spec.provisioner = provisioner;
    }

    void to_json(nlohmann::json& j) const;
};

// 卷绑定到的PVC
struct ClaimReference {
    std::string name;
    std::string namespace_;
    std::string uid;

    ClaimReference() = default;
    ClaimReference(const std::string& n, const std::string& ns, const std::string& u)
        : name(n), namespace_(ns), uid(u) {}
};

class PersistentVolumeSpec {
public:
    // 容量，如"10Gi"
    std::string capacity;
    std::vector<AccessMode> access_modes;
    std::string storage_class_name;
    std::optional<ClaimReference> claim_ref;

    void to_json(nlohmann::json& j) const;
};

enum class VolumePhase {
    Available,
    Bound,
    Released
};

class PersistentVolumeStatus {
public:
    VolumePhase phase;

    PersistentVolumeStatus() : phase(VolumePhase::Available) {}

    void to_json(nlohmann::json& j) const;
};

class PersistentVolume {
public:
    static constexpr ResourceKind KIND = ResourceKind::PersistentVolume;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    PersistentVolumeSpec spec;
    PersistentVolumeStatus status;

    PersistentVolume() : api_version("v1"), kind("PersistentVolume") { metadata.namespace_.clear(); }
    PersistentVolume(const std::string& name, const std::string& capacity = "1Gi")
        : api_version("v1"), kind("PersistentVolume"), metadata(name, "") {
        spec.capacity = capacity;
        spec.access_modes = {AccessMode::ReadWriteOnce};
    }

    void to_json(nlohmann::json& j) const;
};

class PersistentVolumeClaimSpec {
public:
    // 请求容量，如"5Gi"
    std::string request;
    std::vector<AccessMode> access_modes;
    std::string storage_class_name;

    void to_json(nlohmann::json& j) const;
};

enum class ClaimPhase {
    Pending,
    Bound,
    Lost
};

class PersistentVolumeClaimStatus {
public:
    ClaimPhase phase;
    std::string volume_name;
    // 已绑定卷的容量
    std::string capacity;

    PersistentVolumeClaimStatus() : phase(ClaimPhase::Pending) {}

    void to_json(nlohmann::json& j) const;
};

class PersistentVolumeClaim {
public:
    static constexpr ResourceKind KIND = ResourceKind::PersistentVolumeClaim;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    PersistentVolumeClaimSpec spec;
    PersistentVolumeClaimStatus status;

    PersistentVolumeClaim() : api_version("v1"), kind("PersistentVolumeClaim") {}
    PersistentVolumeClaim(const std::string& name, const std::string& ns = "default")
        : api_version("v1"), kind("PersistentVolumeClaim"), metadata(name, ns) {
        spec.request = "1Gi";
        spec.access_modes = {AccessMode::ReadWriteOnce};
    }

    void to_json(nlohmann::json& j) const;
};

// 解析"512Mi"、"10Gi"、"1G"之类的容量为字节数，格式错误返回nullopt
std::optional<int64_t> parse_quantity(const std::string& quantity);

std::string concurrency_policy_to_string(ConcurrencyPolicy policy);
std::string job_condition_to_string(JobCondition condition);
std::string strategy_to_string(DeploymentStrategyType type);
std::string reclaim_policy_to_string(ReclaimPolicy policy);
std::string access_mode_to_string(AccessMode mode);
std::string volume_phase_to_string(VolumePhase phase);
std::string claim_phase_to_string(ClaimPhase phase);

} // namespace kubesim
