#include "api/types.h"
#include <sstream>
#include <uuid/uuid.h>

namespace kubesim {

namespace {

// 固定的命名空间UUID，用于生成基于名字的UID
const uuid_t kUidNamespace = {
    0x6b, 0x75, 0x62, 0x65, 0x73, 0x69, 0x6d, 0x2d,
    0x8e, 0x3f, 0x4a, 0x11, 0x9c, 0x52, 0x0d, 0x77
};

nlohmann::json labels_to_json(const Labels& labels) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : labels) {
        j[key] = value;
    }
    return j;
}

void probe_to_json(nlohmann::json& j, const Probe& probe) {
    j = nlohmann::json{
        {"type", probe_type_to_string(probe.type)},
        {"initialDelayTicks", probe.initial_delay_ticks},
        {"periodTicks", probe.period_ticks},
        {"failureThreshold", probe.failure_threshold}
    };
    if (!probe.target.empty()) {
        j["target"] = probe.target;
    }
}

std::string init_state_to_string(InitContainerState state) {
    switch (state) {
        case InitContainerState::Waiting: return "Waiting";
        case InitContainerState::Running: return "Running";
        case InitContainerState::Completed: return "Completed";
        case InitContainerState::Failed: return "Failed";
        default: return "Waiting";
    }
}

std::string restart_policy_to_string(RestartPolicy policy) {
    switch (policy) {
        case RestartPolicy::Always: return "Always";
        case RestartPolicy::OnFailure: return "OnFailure";
        case RestartPolicy::Never: return "Never";
        default: return "Always";
    }
}

} // namespace

// ObjectMeta实现
void ObjectMeta::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"name", name},
        {"uid", uid},
        {"creationTick", creation_tick},
        {"labels", labels_to_json(labels)}
    };

    if (!namespace_.empty()) {
        j["namespace"] = namespace_;
    }

    if (!annotations.empty()) {
        j["annotations"] = labels_to_json(annotations);
    }

    if (owner_reference) {
        j["ownerReference"] = {
            {"kind", kind_to_string(owner_reference->kind)},
            {"name", owner_reference->name},
            {"uid", owner_reference->uid}
        };
    }

    if (deletion_tick) {
        j["deletionTick"] = *deletion_tick;
    }
}

std::string ObjectMeta::generate_uid(ResourceKind kind, const std::string& ns,
                                     const std::string& name, uint64_t sequence) {
    std::ostringstream oss;
    oss << kind_to_string(kind) << "/" << ns << "/" << name << "/" << sequence;
    std::string key = oss.str();

    uuid_t uuid;
    uuid_generate_sha1(uuid, kUidNamespace, key.c_str(), key.size());
    char uuid_str[37];
    uuid_unparse_lower(uuid, uuid_str);
    return std::string(uuid_str);
}

// Node实现
void NodeSpec::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"capacity", {{"pods", capacity_pods}}},
        {"unschedulable", unschedulable}
    };

    if (!taints.empty()) {
        j["taints"] = nlohmann::json::array();
        for (const auto& taint : taints) {
            nlohmann::json taint_json = {
                {"key", taint.key},
                {"effect", effect_to_string(taint.effect)}
            };
            if (!taint.value.empty()) {
                taint_json["value"] = taint.value;
            }
            j["taints"].push_back(taint_json);
        }
    }
}

void NodeStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"conditions", {{{"type", "Ready"}, {"status", ready ? "True" : "False"}}}},
        {"allocatedPods", allocated_pods}
    };
}

void Node::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"apiVersion", api_version},
        {"kind", kind}
    };

    nlohmann::json metadata_json;
    metadata.to_json(metadata_json);
    j["metadata"] = metadata_json;

    nlohmann::json spec_json;
    spec.to_json(spec_json);
    j["spec"] = spec_json;

    nlohmann::json status_json;
    status.to_json(status_json);
    j["status"] = status_json;
}

// Pod实现
void PodSpec::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"image", image},
        {"restartPolicy", restart_policy_to_string(restart_policy)}
    };

    if (!node_name.empty()) {
        j["nodeName"] = node_name;
    }

    if (!required_node.empty()) {
        j["requiredNode"] = required_node;
    }

    if (!tolerations.empty()) {
        j["tolerations"] = nlohmann::json::array();
        for (const auto& toleration : tolerations) {
            nlohmann::json t = {
                {"key", toleration.key},
                {"operator", toleration.operator_ == TolerationOperator::Exists ? "Exists" : "Equal"}
            };
            if (!toleration.value.empty()) {
                t["value"] = toleration.value;
            }
            if (toleration.effect) {
                t["effect"] = effect_to_string(*toleration.effect);
            }
            j["tolerations"].push_back(t);
        }
    }

    if (startup_probe) {
        probe_to_json(j["startupProbe"], *startup_probe);
    }
    if (readiness_probe) {
        probe_to_json(j["readinessProbe"], *readiness_probe);
    }
    if (liveness_probe) {
        probe_to_json(j["livenessProbe"], *liveness_probe);
    }

    if (!claim_names.empty()) {
        j["volumes"] = nlohmann::json::array();
        for (const auto& claim : claim_names) {
            j["volumes"].push_back({{"persistentVolumeClaim", {{"claimName", claim}}}});
        }
    }

    if (!init_containers.empty()) {
        j["initContainers"] = nlohmann::json::array();
        for (const auto& container : init_containers) {
            j["initContainers"].push_back({
                {"name", container.name},
                {"image", container.image},
                {"fails", container.fails}
            });
        }
    }

    if (failure_mode != FailureMode::None) {
        j["failureMode"] = failure_mode_to_string(failure_mode);
    }

    if (completion_ticks > 0) {
        j["completionTicks"] = completion_ticks;
    }

    if (ordinal) {
        j["ordinal"] = *ordinal;
    }
}

void PodStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"phase", phase_to_string(phase)},
        {"ready", ready},
        {"restartCount", restart_count},
        {"startTick", start_tick}
    };

    if (!reason.empty()) {
        j["reason"] = reason;
    }

    if (!message.empty()) {
        j["message"] = message;
    }

    if (running_since) {
        j["runningSince"] = *running_since;
    }

    if (completion_remaining) {
        j["completionRemaining"] = *completion_remaining;
    }

    if (!init_container_statuses.empty()) {
        j["initContainerStatuses"] = nlohmann::json::array();
        for (const auto& status : init_container_statuses) {
            j["initContainerStatuses"].push_back({
                {"name", status.name},
                {"state", init_state_to_string(status.state)}
            });
        }
    }

    if (cpu_utilization) {
        j["cpuUtilization"] = *cpu_utilization;
    }
}

void Pod::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"apiVersion", api_version},
        {"kind", kind}
    };

    nlohmann::json metadata_json;
    metadata.to_json(metadata_json);
    j["metadata"] = metadata_json;

    nlohmann::json spec_json;
    spec.to_json(spec_json);
    j["spec"] = spec_json;

    nlohmann::json status_json;
    status.to_json(status_json);
    j["status"] = status_json;
}

void PodTemplate::to_json(nlohmann::json& j) const {
    nlohmann::json spec_json;
    spec.to_json(spec_json);
    j = nlohmann::json{
        {"labels", labels_to_json(labels)},
        {"spec", spec_json}
    };
}

// Service实现
void ServiceSpec::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"selector", labels_to_json(selector)},
        {"port", port}
    };
}

void ServiceStatus::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"endpoints", endpoints}
    };
}

void Service::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"apiVersion", api_version},
        {"kind", kind}
    };

    nlohmann::json metadata_json;
    metadata.to_json(metadata_json);
    j["metadata"] = metadata_json;

    nlohmann::json spec_json;
    spec.to_json(spec_json);
    j["spec"] = spec_json;

    nlohmann::json status_json;
    status.to_json(status_json);
    j["status"] = status_json;
}

// Event实现
void Event::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"tick", tick},
        {"type", event_type_to_string(type)},
        {"reason", reason},
        {"objectKind", kind_to_string(object_kind)},
        {"objectName", object_name},
        {"message", message}
    };
}

// 字符串转换
std::string kind_to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Node: return "Node";
        case ResourceKind::Pod: return "Pod";
        case ResourceKind::ReplicaSet: return "ReplicaSet";
        case ResourceKind::Deployment: return "Deployment";
        case ResourceKind::StatefulSet: return "StatefulSet";
        case ResourceKind::DaemonSet: return "DaemonSet";
        case ResourceKind::Job: return "Job";
        case ResourceKind::CronJob: return "CronJob";
        case ResourceKind::HorizontalPodAutoscaler: return "HorizontalPodAutoscaler";
        case ResourceKind::PodDisruptionBudget: return "PodDisruptionBudget";
        case ResourceKind::Service: return "Service";
        case ResourceKind::StorageClass: return "StorageClass";
        case ResourceKind::PersistentVolume: return "PersistentVolume";
        case ResourceKind::PersistentVolumeClaim: return "PersistentVolumeClaim";
        default: return "Unknown";
    }
}

std::string phase_to_string(PodPhase phase) {
    switch (phase) {
        case PodPhase::Pending: return "Pending";
        case PodPhase::Running: return "Running";
        case PodPhase::Succeeded: return "Succeeded";
        case PodPhase::Failed: return "Failed";
        case PodPhase::Terminating: return "Terminating";
        default: return "Pending";
    }
}

PodPhase string_to_pod_phase(const std::string& str) {
    if (str == "Running") return PodPhase::Running;
    if (str == "Succeeded") return PodPhase::Succeeded;
    if (str == "Failed") return PodPhase::Failed;
    if (str == "Terminating") return PodPhase::Terminating;
    return PodPhase::Pending;
}

std::string effect_to_string(TaintEffect effect) {
    switch (effect) {
        case TaintEffect::NoSchedule: return "NoSchedule";
        case TaintEffect::PreferNoSchedule: return "PreferNoSchedule";
        case TaintEffect::NoExecute: return "NoExecute";
        default: return "NoSchedule";
    }
}

std::optional<TaintEffect> string_to_taint_effect(const std::string& str) {
    if (str == "NoSchedule") return TaintEffect::NoSchedule;
    if (str == "PreferNoSchedule") return TaintEffect::PreferNoSchedule;
    if (str == "NoExecute") return TaintEffect::NoExecute;
    return std::nullopt;
}

std::string probe_type_to_string(ProbeType type) {
    switch (type) {
        case ProbeType::HttpGet: return "httpGet";
        case ProbeType::TcpSocket: return "tcpSocket";
        case ProbeType::Exec: return "exec";
        default: return "httpGet";
    }
}

std::string failure_mode_to_string(FailureMode mode) {
    switch (mode) {
        case FailureMode::None: return "None";
        case FailureMode::ImagePullError: return "ImagePullError";
        case FailureMode::CrashLoopBackOff: return "CrashLoopBackOff";
        case FailureMode::OOMKilled: return "OOMKilled";
        case FailureMode::LivenessFailure: return "LivenessFailure";
        case FailureMode::ReadinessFailure: return "ReadinessFailure";
        case FailureMode::StartupFailure: return "StartupFailure";
        case FailureMode::ExitFailure: return "ExitFailure";
        default: return "None";
    }
}

std::optional<FailureMode> string_to_failure_mode(const std::string& str) {
    if (str == "None") return FailureMode::None;
    if (str == "ImagePullError") return FailureMode::ImagePullError;
    if (str == "CrashLoopBackOff") return FailureMode::CrashLoopBackOff;
    if (str == "OOMKilled") return FailureMode::OOMKilled;
    if (str == "LivenessFailure") return FailureMode::LivenessFailure;
    if (str == "ReadinessFailure") return FailureMode::ReadinessFailure;
    if (str == "StartupFailure") return FailureMode::StartupFailure;
    if (str == "ExitFailure") return FailureMode::ExitFailure;
    return std::nullopt;
}

std::string event_type_to_string(EventType type) {
    return type == EventType::Warning ? "Warning" : "Normal";
}

std::string status_to_string(ApiStatus status) {
    switch (status) {
        case ApiStatus::Success: return "Success";
        case ApiStatus::Failure: return "Failure";
        case ApiStatus::NotFound: return "NotFound";
        case ApiStatus::AlreadyExists: return "AlreadyExists";
        case ApiStatus::Invalid: return "Invalid";
        default: return "Failure";
    }
}

} // namespace kubesim
