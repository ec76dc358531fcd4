#include "controller/job_controller.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace kubesim {

int32_t JobController::count_active(ClusterStore& store, const Job& job) {
    int32_t active = 0;
    for (const Pod* pod : store.owned_by<Pod>(job.metadata.uid)) {
        if (is_active_pod(*pod)) {
            ++active;
        }
    }
    return active;
}

void JobController::terminate_active(TickContext& ctx, Job& job) {
    for (Pod* pod : ctx.store.owned_by<Pod>(job.metadata.uid)) {
        if (is_active_pod(*pod)) {
            mark_pod_deleting(*pod, ctx.tick);
            ctx.normal(ResourceKind::Job, job.metadata.name, "SuccessfulDelete", "Deleted pod: " + pod->metadata.name);
        }
    }
    job.status.active = 0;
}

void JobController::sync(TickContext& ctx, Job& job) {
    if (!job.status.start_tick) {
        job.status.start_tick = ctx.tick;
    }

    // 统计新结束的Pod
    for (Pod* pod : ctx.store.owned_by<Pod>(job.metadata.uid)) {
        if (!pod->is_terminal() || pod->metadata.annotations.count(TRACKED_ANNOTATION)) {
            continue;
        }
        pod->metadata.annotations[TRACKED_ANNOTATION] = "true";
        if (pod->status.phase == PodPhase::Succeeded) {
            ++job.status.succeeded;
        } else {
            ++job.status.failed;
        }
    }

    if (job.status.failed > job.spec.backoff_limit) {
        job.status.condition = JobCondition::Failed;
        terminate_active(ctx, job);
        ctx.warning(ResourceKind::Job, job.metadata.name, "BackoffLimitExceeded",
                    "Job has reached the specified backoff limit");
        return;
    }

    if (job.status.succeeded >= job.spec.completions) {
        job.status.condition = JobCondition::Complete;
        job.status.completion_tick = ctx.tick;
        terminate_active(ctx, job);
        ctx.normal(ResourceKind::Job, job.metadata.name, "Completed", "Job completed");
        return;
    }

    int32_t active = count_active(ctx.store, job);
    int32_t wanted = std::min(job.spec.parallelism, job.spec.completions - job.status.succeeded);
    int32_t completion_ticks = job.spec.completion_ticks > 0 ? job.spec.completion_ticks
                                                             : ctx.config.default_job_completion_ticks;

    // parallelism被调小时删除最新的多余Pod
    if (active > wanted) {
        auto owned = ctx.store.owned_by<Pod>(job.metadata.uid);
        for (auto it = owned.rbegin(); it != owned.rend() && active > wanted; ++it) {
            if (is_active_pod(**it)) {
                mark_pod_deleting(**it, ctx.tick);
                --active;
            }
        }
    }

    for (int32_t i = active; i < wanted; ++i) {
        PodTemplate tmpl = job.spec.template_;
        tmpl.labels[LabelKeys::JOB_NAME] = job.metadata.name;
        tmpl.spec.completion_ticks = std::max(completion_ticks, 1);
        // 失败的Pod不原地重启，由backoffLimit决定是否重建
        tmpl.spec.restart_policy = RestartPolicy::Never;

        std::string pod_name = generate_pod_name(ctx.store, job.metadata.name, job.metadata.namespace_);
        create_pod_from_template(ctx, tmpl, pod_name, job.metadata.namespace_, owner_reference_for(job));
        ++active;
    }
    job.status.active = active;
}

void JobController::reconcile(TickContext& ctx) {
    for (Job* job : ctx.store.list<Job>()) {
        if (job->metadata.is_deleting()) {
            for (Pod* pod : ctx.store.owned_by<Pod>(job->metadata.uid)) {
                mark_pod_deleting(*pod, ctx.tick);
            }
            continue;
        }
        if (job->status.finished()) {
            continue;
        }
        sync(ctx, *job);
    }
}

} // namespace kubesim
