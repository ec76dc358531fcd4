#include "controller/pod_lifecycle.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace kubesim {

void PodLifecycle::add_failure_rule(const std::string& image, FailureMode mode) {
    failure_rules_[image] = mode;
}

bool PodLifecycle::remove_failure_rule(const std::string& image) {
    return failure_rules_.erase(image) > 0;
}

bool PodLifecycle::probe_due(const Probe& probe, Tick age) {
    if (age < probe.initial_delay_ticks) {
        return false;
    }
    int32_t period = std::max(probe.period_ticks, 1);
    return (age - probe.initial_delay_ticks) % period == 0;
}

void PodLifecycle::reconcile(TickContext& ctx) {
    for (Pod* pod : ctx.store.list<Pod>()) {
        if (!is_active_pod(*pod)) {
            continue;
        }

        if (pod->status.phase == PodPhase::Pending && pod->spec.failure_mode == FailureMode::None) {
            auto rule = failure_rules_.find(pod->spec.image);
            if (rule != failure_rules_.end()) {
                pod->spec.failure_mode = rule->second;
            }
        }

        // 未调度的Pod由调度器处理
        if (pod->spec.node_name.empty()) {
            continue;
        }

        if (pod->status.phase == PodPhase::Pending) {
            advance_pending(ctx, *pod);
        } else if (pod->status.phase == PodPhase::Running) {
            advance_running(ctx, *pod);
        }
    }
}

bool PodLifecycle::step_init_containers(TickContext& ctx, Pod& pod) {
    const auto& containers = pod.spec.init_containers;
    auto& statuses = pod.status.init_container_statuses;
    if (containers.empty()) {
        return true;
    }

    if (statuses.size() != containers.size()) {
        statuses.clear();
        for (const auto& container : containers) {
            statuses.emplace_back(container.name);
        }
    }

    for (size_t i = 0; i < containers.size(); ++i) {
        auto& status = statuses[i];
        switch (status.state) {
            case InitContainerState::Completed:
                continue;
            case InitContainerState::Failed:
                return false;
            case InitContainerState::Waiting:
                status.state = InitContainerState::Running;
                pod.status.reason = "Init:" + std::to_string(i) + "/" + std::to_string(containers.size());
                return false;
            case InitContainerState::Running:
                if (containers[i].fails) {
                    status.state = InitContainerState::Failed;
                    pod.status.reason = "Init:Error";
                    pod.status.message = "init container " + containers[i].name + " failed";
                    ctx.warning(ResourceKind::Pod, pod.metadata.name, "Failed",
                                "Init container " + containers[i].name + " exited with error");
                } else {
                    status.state = InitContainerState::Completed;
                    pod.status.reason = "Init:" + std::to_string(i + 1) + "/" + std::to_string(containers.size());
                }
                // 每个tick只推进一步
                return false;
        }
    }
    return true;
}

void PodLifecycle::advance_pending(TickContext& ctx, Pod& pod) {
    if (pod.spec.failure_mode == FailureMode::ImagePullError) {
        if (pod.status.reason != "ErrImagePull") {
            pod.status.reason = "ErrImagePull";
            pod.status.message = "Failed to pull image \"" + pod.spec.image + "\"";
            ctx.warning(ResourceKind::Pod, pod.metadata.name, "Failed", pod.status.message);
        }
        return;
    }

    if (!step_init_containers(ctx, pod)) {
        return;
    }

    if (ctx.tick - pod.status.start_tick < ctx.config.settle_delay_ticks) {
        return;
    }
    if (ctx.tick < pod.status.backoff_until) {
        return;
    }

    start(ctx, pod);
}

void PodLifecycle::start(TickContext& ctx, Pod& pod) {
    pod.status.phase = PodPhase::Running;
    pod.status.running_since = ctx.tick;
    pod.status.reason.clear();
    pod.status.message.clear();
    pod.status.startup_probe_succeeded = !pod.spec.startup_probe.has_value();
    pod.status.startup_failures = 0;
    pod.status.readiness_failures = 0;
    pod.status.liveness_failures = 0;
    // 没有就绪探针时启动即就绪
    pod.status.ready = !pod.spec.readiness_probe && pod.status.startup_probe_succeeded;

    if (pod.spec.completion_ticks > 0) {
        pod.status.completion_remaining = pod.spec.completion_ticks;
    }

    spdlog::debug("[PodLifecycle] pod {} running on {}", pod.metadata.name, pod.spec.node_name);
    ctx.normal(ResourceKind::Pod, pod.metadata.name, "Started", "Started container with image " + pod.spec.image);
}

void PodLifecycle::advance_running(TickContext& ctx, Pod& pod) {
    Tick age = ctx.tick - pod.status.running_since.value_or(ctx.tick);
    if (age < 1) {
        return;
    }

    switch (pod.spec.failure_mode) {
        case FailureMode::CrashLoopBackOff:
            restart(ctx, pod, "CrashLoopBackOff");
            return;
        case FailureMode::OOMKilled:
            fail(ctx, pod, "OOMKilled", "Container exceeded its memory limit");
            mark_pod_deleting(pod, ctx.tick);
            return;
        default:
            break;
    }

    // 启动探针成功前挂起其他探针
    if (pod.spec.startup_probe && !pod.status.startup_probe_succeeded) {
        const Probe& probe = *pod.spec.startup_probe;
        if (probe_due(probe, age)) {
            if (pod.spec.failure_mode == FailureMode::StartupFailure) {
                ++pod.status.startup_failures;
                if (pod.status.startup_failures >= probe.failure_threshold) {
                    ctx.warning(ResourceKind::Pod, pod.metadata.name, "Unhealthy",
                                "Startup probe failed " + std::to_string(pod.status.startup_failures) + " times");
                    restart(ctx, pod, "StartupProbeFailed");
                    return;
                }
            } else {
                pod.status.startup_probe_succeeded = true;
                pod.status.startup_failures = 0;
            }
        }
        if (!pod.status.startup_probe_succeeded) {
            pod.status.ready = false;
            return;
        }
    }

    if (pod.spec.readiness_probe) {
        const Probe& probe = *pod.spec.readiness_probe;
        if (probe_due(probe, age)) {
            if (pod.spec.failure_mode == FailureMode::ReadinessFailure) {
                ++pod.status.readiness_failures;
                if (pod.status.readiness_failures >= probe.failure_threshold && pod.status.ready) {
                    pod.status.ready = false;
                    ctx.warning(ResourceKind::Pod, pod.metadata.name, "Unhealthy", "Readiness probe failed");
                }
            } else {
                pod.status.readiness_failures = 0;
                pod.status.ready = true;
            }
        }
    } else {
        pod.status.ready = true;
    }

    if (pod.spec.liveness_probe) {
        const Probe& probe = *pod.spec.liveness_probe;
        if (probe_due(probe, age)) {
            if (pod.spec.failure_mode == FailureMode::LivenessFailure) {
                ++pod.status.liveness_failures;
                if (pod.status.liveness_failures >= probe.failure_threshold) {
                    ctx.warning(ResourceKind::Pod, pod.metadata.name, "Unhealthy",
                                "Liveness probe failed " + std::to_string(pod.status.liveness_failures) + " times");
                    restart(ctx, pod, "LivenessProbeFailed");
                    return;
                }
            } else {
                pod.status.liveness_failures = 0;
            }
        }
    }

    if (pod.status.completion_remaining) {
        int32_t remaining = *pod.status.completion_remaining - 1;
        pod.status.completion_remaining = remaining;
        if (remaining <= 0) {
            if (pod.spec.failure_mode == FailureMode::ExitFailure) {
                fail(ctx, pod, "Error", "Container exited with non-zero status");
            } else {
                pod.status.phase = PodPhase::Succeeded;
                pod.status.ready = false;
                pod.status.reason = "Completed";
                ctx.normal(ResourceKind::Pod, pod.metadata.name, "Completed", "Container completed successfully");
            }
        }
    }
}

void PodLifecycle::restart(TickContext& ctx, Pod& pod, const std::string& reason) {
    if (pod.spec.restart_policy == RestartPolicy::Never) {
        fail(ctx, pod, reason, "Container failed and restart policy is Never");
        return;
    }

    ++pod.status.restart_count;
    int32_t backoff = std::min(pod.status.restart_count, ctx.config.max_restart_backoff_ticks);

    pod.status.phase = PodPhase::Pending;
    pod.status.ready = false;
    pod.status.reason = reason;
    pod.status.start_tick = ctx.tick;
    pod.status.backoff_until = ctx.tick + backoff;
    pod.status.running_since.reset();
    pod.status.completion_remaining.reset();
    pod.status.startup_probe_succeeded = false;
    pod.status.startup_failures = 0;
    pod.status.readiness_failures = 0;
    pod.status.liveness_failures = 0;

    ctx.warning(ResourceKind::Pod, pod.metadata.name, "BackOff",
                "Back-off " + std::to_string(backoff) + " tick(s) restarting failed container (restart " +
                std::to_string(pod.status.restart_count) + ")");
}

void PodLifecycle::fail(TickContext& ctx, Pod& pod, const std::string& reason, const std::string& message) {
    pod.status.phase = PodPhase::Failed;
    pod.status.ready = false;
    pod.status.reason = reason;
    pod.status.message = message;
    pod.status.completion_remaining.reset();
    ctx.warning(ResourceKind::Pod, pod.metadata.name, reason, message);
}

} // namespace kubesim
