#include "controller/cronjob_controller.h"
#include "controller/cron_schedule.h"
#include <spdlog/spdlog.h>

namespace kubesim {

void CronJobController::create_job(TickContext& ctx, CronJob& cron_job) {
    std::string job_name = cron_job.metadata.name + "-" + std::to_string(ctx.tick);
    if (ctx.store.get<Job>(job_name, cron_job.metadata.namespace_)) {
        spdlog::debug("[CronJobController] job {} already exists", job_name);
        return;
    }

    Job job(job_name, cron_job.metadata.namespace_);
    job.metadata.labels = cron_job.spec.job_template.template_.labels;
    job.metadata.owner_reference = owner_reference_for(cron_job);
    job.spec = cron_job.spec.job_template;

    ctx.store.add(std::move(job), ctx.tick);
    cron_job.status.last_schedule_tick = ctx.tick;
    ctx.normal(ResourceKind::CronJob, cron_job.metadata.name, "SuccessfulCreate", "Created job " + job_name);
}

void CronJobController::prune_history(TickContext& ctx, CronJob& cron_job) {
    std::vector<Job*> succeeded;
    std::vector<Job*> failed;
    for (Job* job : ctx.store.owned_by<Job>(cron_job.metadata.uid)) {
        if (job->metadata.is_deleting()) {
            continue;
        }
        if (job->status.condition == JobCondition::Complete) {
            succeeded.push_back(job);
        } else if (job->status.condition == JobCondition::Failed) {
            failed.push_back(job);
        }
    }

    auto prune = [&](std::vector<Job*>& jobs, int32_t limit) {
        int32_t excess = static_cast<int32_t>(jobs.size()) - std::max(limit, 0);
        for (int32_t i = 0; i < excess; ++i) {
            mark_deleting(jobs[i]->metadata, ctx.tick);
            ctx.normal(ResourceKind::CronJob, cron_job.metadata.name, "SuccessfulDelete",
                       "Deleted job " + jobs[i]->metadata.name);
        }
    };
    prune(succeeded, cron_job.spec.successful_jobs_history_limit);
    prune(failed, cron_job.spec.failed_jobs_history_limit);
}

void CronJobController::sync(TickContext& ctx, CronJob& cron_job) {
    std::vector<Job*> active;
    for (Job* job : ctx.store.owned_by<Job>(cron_job.metadata.uid)) {
        if (!job->metadata.is_deleting() && !job->status.finished()) {
            active.push_back(job);
        }
    }

    auto schedule = CronSchedule::parse(cron_job.spec.schedule);
    bool due = schedule && !cron_job.spec.suspend && schedule->matches(ctx.tick) &&
               ctx.tick > cron_job.metadata.creation_tick &&
               (!cron_job.status.last_schedule_tick || ctx.tick > *cron_job.status.last_schedule_tick);

    if (due) {
        if (!active.empty() && cron_job.spec.concurrency_policy == ConcurrencyPolicy::Forbid) {
            ctx.normal(ResourceKind::CronJob, cron_job.metadata.name, "JobAlreadyActive",
                       "Not starting job because prior execution is running and concurrency policy is Forbid");
        } else {
            if (cron_job.spec.concurrency_policy == ConcurrencyPolicy::Replace) {
                for (Job* job : active) {
                    mark_deleting(job->metadata, ctx.tick);
                    ctx.normal(ResourceKind::CronJob, cron_job.metadata.name, "SuccessfulDelete",
                               "Deleted job " + job->metadata.name);
                }
                active.clear();
            }
            create_job(ctx, cron_job);
        }
    }

    prune_history(ctx, cron_job);

    int32_t count = 0;
    for (const Job* job : ctx.store.owned_by<Job>(cron_job.metadata.uid)) {
        if (!job->metadata.is_deleting() && !job->status.finished()) {
            ++count;
        }
    }
    cron_job.status.active = count;
}

void CronJobController::reconcile(TickContext& ctx) {
    for (CronJob* cron_job : ctx.store.list<CronJob>()) {
        if (cron_job->metadata.is_deleting()) {
            continue;
        }
        sync(ctx, *cron_job);
    }
}

} // namespace kubesim
