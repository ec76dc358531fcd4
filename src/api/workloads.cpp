#include "api/workloads.h"
#include <cctype>
#include <limits>

namespace kubesim {

namespace {

nlohmann::json selector_to_json(const Labels& selector) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : selector) {
        j[key] = value;
    }
    return j;
}

// apiVersion/kind/metadata/spec/status 的公共序列化
template<typename T>
void object_to_json(nlohmann::json& j, const T& obj) {
    j = nlohmann::json{
        {"apiVersion", obj.api_version},
        {"kind", obj.kind}
    };

    nlohmann::json metadata_json;
    obj.metadata.to_json(metadata_json);
    j["metadata"] = metadata_json;

    nlohmann::json spec_json;
    obj.spec.to_json(spec_json);
    j["spec"] = spec_json;

    nlohmann::json status_json;
    obj.status.to_json(status_json);
    j["status"] = status_json;
}

} // namespace

// ReplicaSet实现
void ReplicaSetSpec::to_json(nlohmann::json& j) const {
    nlohmann::json template_json;
    template_.to_json(template_json);
    j = nlohmann::json{
        {"replicas", replicas},
        {"selector", selector_to_json(selector)},
        {"template", template_json}
    };
}

void ReplicaSetStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"replicas", replicas},
        {"readyReplicas", ready_replicas},
        {"availableReplicas", available_replicas}
    };
}

std::string ReplicaSet::template_hash() const {
    auto it = metadata.labels.find(LabelKeys::POD_TEMPLATE_HASH);
    return it == metadata.labels.end() ? "" : it->second;
}

void ReplicaSet::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

// Deployment实现
void DeploymentSpec::to_json(nlohmann::json& j) const {
    nlohmann::json template_json;
    template_.to_json(template_json);
    j = nlohmann::json{
        {"replicas", replicas},
        {"selector", selector_to_json(selector)},
        {"template", template_json},
        {"revisionHistoryLimit", revision_history_limit}
    };

    nlohmann::json strategy_json = {{"type", strategy_to_string(strategy.type)}};
    if (strategy.type == DeploymentStrategyType::RollingUpdate) {
        strategy_json["rollingUpdate"] = {
            {"maxSurge", strategy.max_surge},
            {"maxUnavailable", strategy.max_unavailable}
        };
    }
    j["strategy"] = strategy_json;
}

void DeploymentStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"replicas", replicas},
        {"updatedReplicas", updated_replicas},
        {"readyReplicas", ready_replicas},
        {"availableReplicas", available_replicas},
        {"conditions", {{{"type", condition}, {"reason", condition_reason}}}}
    };

    if (!current_hash.empty()) {
        j["currentHash"] = current_hash;
    }
}

void Deployment::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

// StatefulSet实现
void StatefulSetSpec::to_json(nlohmann::json& j) const {
    nlohmann::json template_json;
    template_.to_json(template_json);
    j = nlohmann::json{
        {"replicas", replicas},
        {"selector", selector_to_json(selector)},
        {"template", template_json}
    };
}

void StatefulSetStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"replicas", replicas},
        {"readyReplicas", ready_replicas},
        {"currentReplicas", current_replicas},
        {"updatedReplicas", updated_replicas}
    };

    if (!update_revision.empty()) {
        j["updateRevision"] = update_revision;
    }
}

void StatefulSet::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

// DaemonSet实现
void DaemonSetSpec::to_json(nlohmann::json& j) const {
    nlohmann::json template_json;
    template_.to_json(template_json);
    j = nlohmann::json{
        {"selector", selector_to_json(selector)},
        {"template", template_json}
    };
}

void DaemonSetStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"desiredNumberScheduled", desired_number_scheduled},
        {"currentNumberScheduled", current_number_scheduled},
        {"numberReady", number_ready}
    };
}

void DaemonSet::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

// Job实现
void JobSpec::to_json(nlohmann::json& j) const {
    nlohmann::json template_json;
    template_.to_json(template_json);
    j = nlohmann::json{
        {"completions", completions},
        {"parallelism", parallelism},
        {"backoffLimit", backoff_limit},
        {"template", template_json}
    };

    if (completion_ticks > 0) {
        j["completionTicks"] = completion_ticks;
    }
}

void JobStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"succeeded", succeeded},
        {"failed", failed},
        {"active", active}
    };

    if (start_tick) {
        j["startTick"] = *start_tick;
    }

    if (completion_tick) {
        j["completionTick"] = *completion_tick;
    }

    if (condition != JobCondition::None) {
        j["condition"] = job_condition_to_string(condition);
    }
}

void Job::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

// CronJob实现
void CronJobSpec::to_json(nlohmann::json& j) const {
    nlohmann::json job_json;
    job_template.to_json(job_json);
    j = nlohmann::json{
        {"schedule", schedule},
        {"concurrencyPolicy", concurrency_policy_to_string(concurrency_policy)},
        {"suspend", suspend},
        {"successfulJobsHistoryLimit", successful_jobs_history_limit},
        {"failedJobsHistoryLimit", failed_jobs_history_limit},
        {"jobTemplate", job_json}
    };
}

void CronJobStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"active", active}
    };

    if (last_schedule_tick) {
        j["lastScheduleTick"] = *last_schedule_tick;
    }
}

void CronJob::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

// HorizontalPodAutoscaler实现
void HorizontalPodAutoscalerSpec::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"scaleTargetRef", {
            {"kind", kind_to_string(scale_target_ref.kind)},
            {"name", scale_target_ref.name}
        }},
        {"minReplicas", min_replicas},
        {"maxReplicas", max_replicas},
        {"targetCPUUtilizationPercentage", target_cpu_utilization}
    };
}

void HorizontalPodAutoscalerStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"currentReplicas", current_replicas},
        {"desiredReplicas", desired_replicas}
    };

    if (current_cpu_utilization) {
        j["currentCPUUtilizationPercentage"] = *current_cpu_utilization;
    }

    if (last_scale_tick) {
        j["lastScaleTick"] = *last_scale_tick;
    }
}

void HorizontalPodAutoscaler::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

// PodDisruptionBudget实现
void PodDisruptionBudgetSpec::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"selector", selector_to_json(selector)}
    };

    if (min_available) {
        j["minAvailable"] = *min_available;
    }

    if (max_unavailable) {
        j["maxUnavailable"] = *max_unavailable;
    }
}

void PodDisruptionBudgetStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"currentHealthy", current_healthy},
        {"desiredHealthy", desired_healthy},
        {"expectedPods", expected_pods},
        {"disruptionsAllowed", disruptions_allowed}
    };
}

void PodDisruptionBudget::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

namespace {

nlohmann::json access_modes_to_json(const std::vector<AccessMode>& modes) {
    nlohmann::json j = nlohmann::json::array();
    for (AccessMode mode : modes) {
        j.push_back(access_mode_to_string(mode));
    }
    return j;
}

} // namespace

// StorageClass实现
void StorageClassSpec::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"provisioner", provisioner},
        {"reclaimPolicy", reclaim_policy_to_string(reclaim_policy)}
    };
}

// StorageClass没有spec/status，字段直接放在顶层
void StorageClass::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"apiVersion", api_version},
        {"kind", kind}
    };

    nlohmann::json metadata_json;
    metadata.to_json(metadata_json);
    j["metadata"] = metadata_json;

    nlohmann::json spec_json;
    spec.to_json(spec_json);
    j.update(spec_json);
}

// PersistentVolume实现
void PersistentVolumeSpec::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"capacity", {{"storage", capacity}}},
        {"accessModes", access_modes_to_json(access_modes)},
        {"storageClassName", storage_class_name}
    };

    if (claim_ref) {
        j["claimRef"] = {
            {"name", claim_ref->name},
            {"namespace", claim_ref->namespace_},
            {"uid", claim_ref->uid}
        };
    }
}

void PersistentVolumeStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{{"phase", volume_phase_to_string(phase)}};
}

void PersistentVolume::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

// PersistentVolumeClaim实现
void PersistentVolumeClaimSpec::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"resources", {{"requests", {{"storage", request}}}}},
        {"accessModes", access_modes_to_json(access_modes)},
        {"storageClassName", storage_class_name}
    };
}

void PersistentVolumeClaimStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{{"phase", claim_phase_to_string(phase)}};

    if (!volume_name.empty()) {
        j["volumeName"] = volume_name;
    }

    if (!capacity.empty()) {
        j["capacity"] = {{"storage", capacity}};
    }
}

void PersistentVolumeClaim::to_json(nlohmann::json& j) const {
    object_to_json(j, *this);
}

std::optional<int64_t> parse_quantity(const std::string& quantity) {
    size_t digits = 0;
    while (digits < quantity.size() && std::isdigit(static_cast<unsigned char>(quantity[digits]))) {
        ++digits;
    }
    if (digits == 0 || digits > 18) {
        return std::nullopt;
    }

    static const std::map<std::string, int64_t> multipliers = {
        {"", 1},
        {"k", 1000LL},
        {"M", 1000LL * 1000},
        {"G", 1000LL * 1000 * 1000},
        {"T", 1000LL * 1000 * 1000 * 1000},
        {"Ki", 1LL << 10},
        {"Mi", 1LL << 20},
        {"Gi", 1LL << 30},
        {"Ti", 1LL << 40}
    };
    auto it = multipliers.find(quantity.substr(digits));
    if (it == multipliers.end()) {
        return std::nullopt;
    }

    int64_t value = std::stoll(quantity.substr(0, digits));
    if (value > std::numeric_limits<int64_t>::max() / it->second) {
        return std::nullopt;
    }
    return value * it->second;
}

std::string concurrency_policy_to_string(ConcurrencyPolicy policy) {
    switch (policy) {
        case ConcurrencyPolicy::Allow: return "Allow";
        case ConcurrencyPolicy::Forbid: return "Forbid";
        case ConcurrencyPolicy::Replace: return "Replace";
        default: return "Forbid";
    }
}

std::string job_condition_to_string(JobCondition condition) {
    switch (condition) {
        case JobCondition::None: return "None";
        case JobCondition::Complete: return "Complete";
        case JobCondition::Failed: return "Failed";
        default: return "None";
    }
}

std::string strategy_to_string(DeploymentStrategyType type) {
    return type == DeploymentStrategyType::Recreate ? "Recreate" : "RollingUpdate";
}

std::string reclaim_policy_to_string(ReclaimPolicy policy) {
    return policy == ReclaimPolicy::Retain ? "Retain" : "Delete";
}

std::string access_mode_to_string(AccessMode mode) {
    switch (mode) {
        case AccessMode::ReadWriteOnce: return "ReadWriteOnce";
        case AccessMode::ReadOnlyMany: return "ReadOnlyMany";
        case AccessMode::ReadWriteMany: return "ReadWriteMany";
        default: return "ReadWriteOnce";
    }
}

std::string volume_phase_to_string(VolumePhase phase) {
    switch (phase) {
        case VolumePhase::Available: return "Available";
        case VolumePhase::Bound: return "Bound";
        case VolumePhase::Released: return "Released";
        default: return "Available";
    }
}

std::string claim_phase_to_string(ClaimPhase phase) {
    switch (phase) {
        case ClaimPhase::Pending: return "Pending";
        case ClaimPhase::Bound: return "Bound";
        case ClaimPhase::Lost: return "Lost";
        default: return "Pending";
    }
}

} // namespace kubesim
