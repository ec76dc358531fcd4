#include "engine/validation.h"
#include "api/labels.h"
#include "controller/cron_schedule.h"
#include <cctype>

namespace kubesim {

namespace {

constexpr size_t kMaxNameLength = 253;

ValidationError validate_probe(const std::optional<Probe>& probe, const std::string& kind) {
    if (!probe) {
        return std::nullopt;
    }
    if (probe->initial_delay_ticks < 0) {
        return kind + " probe initialDelayTicks must not be negative";
    }
    if (probe->period_ticks < 1) {
        return kind + " probe periodTicks must be positive";
    }
    if (probe->failure_threshold < 1) {
        return kind + " probe failureThreshold must be positive";
    }
    return std::nullopt;
}

ValidationError validate_pod_spec(const PodSpec& spec) {
    if (spec.image.empty()) {
        return std::string("image is required");
    }

    for (const auto& toleration : spec.tolerations) {
        if (toleration.key.empty() && toleration.operator_ != TolerationOperator::Exists) {
            return std::string("toleration with an empty key must use operator Exists");
        }
        if (toleration.operator_ == TolerationOperator::Exists && !toleration.value.empty()) {
            return std::string("toleration with operator Exists must not have a value");
        }
    }

    for (const auto& container : spec.init_containers) {
        if (container.name.empty() || container.image.empty()) {
            return std::string("init containers need a name and an image");
        }
    }

    if (spec.completion_ticks < 0) {
        return std::string("completionTicks must not be negative");
    }

    for (const auto& claim : spec.claim_names) {
        if (auto error = validate_name(claim)) {
            return "volume claim: " + *error;
        }
    }

    if (auto error = validate_probe(spec.startup_probe, "startup")) return error;
    if (auto error = validate_probe(spec.readiness_probe, "readiness")) return error;
    return validate_probe(spec.liveness_probe, "liveness");
}

// 选择器非空且匹配模板标签
ValidationError validate_selector(const Labels& selector, const PodTemplate& tmpl) {
    if (selector.empty()) {
        return std::string("selector must not be empty");
    }
    if (!selector_matches(selector, tmpl.labels)) {
        return std::string("selector does not match template labels");
    }
    return validate_pod_spec(tmpl.spec);
}

ValidationError validate_meta(const ObjectMeta& meta, bool namespaced) {
    if (auto error = validate_name(meta.name)) {
        return error;
    }
    if (namespaced && meta.namespace_.empty()) {
        return std::string("namespace is required");
    }
    return std::nullopt;
}

ValidationError validate_job_spec(const JobSpec& spec) {
    if (spec.completions < 1) {
        return std::string("completions must be positive");
    }
    if (spec.parallelism < 1) {
        return std::string("parallelism must be positive");
    }
    if (spec.backoff_limit < 0) {
        return std::string("backoffLimit must not be negative");
    }
    if (spec.completion_ticks < 0) {
        return std::string("completionTicks must not be negative");
    }
    return validate_pod_spec(spec.template_.spec);
}

ValidationError validate_access_modes(const std::vector<AccessMode>& modes) {
    if (modes.empty()) {
        return std::string("at least one access mode is required");
    }
    return std::nullopt;
}

} // namespace

ValidationError validate_name(const std::string& name) {
    if (name.empty()) {
        return std::string("name is required");
    }
    if (name.size() > kMaxNameLength) {
        return std::string("name must be no more than 253 characters");
    }
    for (char c : name) {
        bool ok = std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)) ||
                  c == '-' || c == '.';
        if (!ok) {
            return "name '" + name + "' must consist of lower case alphanumeric characters, '-' or '.'";
        }
    }
    if (name.front() == '-' || name.back() == '-') {
        return "name '" + name + "' must start and end with an alphanumeric character";
    }
    return std::nullopt;
}

ValidationError validate(const Node& node) {
    if (auto error = validate_meta(node.metadata, false)) return error;
    if (node.spec.capacity_pods < 1) {
        return std::string("capacity must be positive");
    }
    for (const auto& taint : node.spec.taints) {
        if (taint.key.empty()) {
            return std::string("taint key is required");
        }
    }
    return std::nullopt;
}

ValidationError validate(const Pod& pod) {
    if (auto error = validate_meta(pod.metadata, true)) return error;
    return validate_pod_spec(pod.spec);
}

ValidationError validate(const ReplicaSet& rs) {
    if (auto error = validate_meta(rs.metadata, true)) return error;
    if (rs.spec.replicas < 0) {
        return std::string("replicas must not be negative");
    }
    return validate_selector(rs.spec.selector, rs.spec.template_);
}

ValidationError validate(const Deployment& deployment) {
    if (auto error = validate_meta(deployment.metadata, true)) return error;
    const auto& spec = deployment.spec;
    if (spec.replicas < 0) {
        return std::string("replicas must not be negative");
    }
    if (spec.revision_history_limit < 0) {
        return std::string("revisionHistoryLimit must not be negative");
    }
    if (spec.strategy.type == DeploymentStrategyType::RollingUpdate) {
        if (spec.strategy.max_surge < 0 || spec.strategy.max_unavailable < 0) {
            return std::string("maxSurge and maxUnavailable must not be negative");
        }
        if (spec.strategy.max_surge == 0 && spec.strategy.max_unavailable == 0) {
            return std::string("maxSurge and maxUnavailable must not both be zero");
        }
    }
    if (spec.template_.labels.count(LabelKeys::POD_TEMPLATE_HASH)) {
        return std::string("template labels must not set pod-template-hash");
    }
    return validate_selector(spec.selector, spec.template_);
}

ValidationError validate(const StatefulSet& sts) {
    if (auto error = validate_meta(sts.metadata, true)) return error;
    if (sts.spec.replicas < 0) {
        return std::string("replicas must not be negative");
    }
    return validate_selector(sts.spec.selector, sts.spec.template_);
}

ValidationError validate(const DaemonSet& ds) {
    if (auto error = validate_meta(ds.metadata, true)) return error;
    return validate_selector(ds.spec.selector, ds.spec.template_);
}

ValidationError validate(const Job& job) {
    if (auto error = validate_meta(job.metadata, true)) return error;
    return validate_job_spec(job.spec);
}

ValidationError validate(const CronJob& cron_job) {
    if (auto error = validate_meta(cron_job.metadata, true)) return error;
    std::string schedule_error;
    if (!CronSchedule::parse(cron_job.spec.schedule, &schedule_error)) {
        return "invalid schedule: " + schedule_error;
    }
    if (cron_job.spec.successful_jobs_history_limit < 0 || cron_job.spec.failed_jobs_history_limit < 0) {
        return std::string("history limits must not be negative");
    }
    return validate_job_spec(cron_job.spec.job_template);
}

ValidationError validate(const HorizontalPodAutoscaler& hpa) {
    if (auto error = validate_meta(hpa.metadata, true)) return error;
    const auto& spec = hpa.spec;
    if (spec.scale_target_ref.kind != ResourceKind::Deployment) {
        return "scale target kind " + kind_to_string(spec.scale_target_ref.kind) + " is not supported";
    }
    if (spec.scale_target_ref.name.empty()) {
        return std::string("scale target name is required");
    }
    if (spec.min_replicas < 1) {
        return std::string("minReplicas must be positive");
    }
    if (spec.max_replicas < spec.min_replicas) {
        return std::string("maxReplicas must not be less than minReplicas");
    }
    if (spec.target_cpu_utilization < 1) {
        return std::string("target CPU utilization must be positive");
    }
    return std::nullopt;
}

ValidationError validate(const PodDisruptionBudget& pdb) {
    if (auto error = validate_meta(pdb.metadata, true)) return error;
    const auto& spec = pdb.spec;
    if (spec.selector.empty()) {
        return std::string("selector must not be empty");
    }
    if (spec.min_available.has_value() == spec.max_unavailable.has_value()) {
        return std::string("exactly one of minAvailable and maxUnavailable must be set");
    }
    if ((spec.min_available && *spec.min_available < 0) || (spec.max_unavailable && *spec.max_unavailable < 0)) {
        return std::string("disruption budget must not be negative");
    }
    return std::nullopt;
}

ValidationError validate(const Service& service) {
    if (auto error = validate_meta(service.metadata, true)) return error;
    if (service.spec.selector.empty()) {
        return std::string("selector must not be empty");
    }
    if (service.spec.port < 1 || service.spec.port > 65535) {
        return std::string("port must be between 1 and 65535");
    }
    return std::nullopt;
}

ValidationError validate(const StorageClass& storage_class) {
    if (auto error = validate_meta(storage_class.metadata, false)) return error;
    if (storage_class.spec.provisioner.empty()) {
        return std::string("provisioner is required");
    }
    return std::nullopt;
}

ValidationError validate(const PersistentVolume& volume) {
    if (auto error = validate_meta(volume.metadata, false)) return error;
    auto capacity = parse_quantity(volume.spec.capacity);
    if (!capacity || *capacity == 0) {
        return "invalid capacity '" + volume.spec.capacity + "'";
    }
    return validate_access_modes(volume.spec.access_modes);
}

ValidationError validate(const PersistentVolumeClaim& claim) {
    if (auto error = validate_meta(claim.metadata, true)) return error;
    auto request = parse_quantity(claim.spec.request);
    if (!request || *request == 0) {
        return "invalid storage request '" + claim.spec.request + "'";
    }
    return validate_access_modes(claim.spec.access_modes);
}

} // namespace kubesim
