#include <gtest/gtest.h>
#include "../include/engine/simulator.h"

using namespace kubesim;

class JobTest : public ::testing::Test {
protected:
    void SetUp() override {
        SimulatorConfig config;
        config.log_level = "warn";
        config.node_pool.count = 2;
        sim = std::make_unique<Simulator>(config);
    }

    Job make_job(const std::string& name, int32_t completions, int32_t parallelism, int32_t backoff_limit) {
        Job job(name);
        job.spec.completions = completions;
        job.spec.parallelism = parallelism;
        job.spec.backoff_limit = backoff_limit;
        job.spec.completion_ticks = 2;
        job.spec.template_.labels = {{"app", name}};
        job.spec.template_.spec.image = "busybox:1.36";
        job.spec.template_.spec.restart_policy = RestartPolicy::Never;
        return job;
    }

    // 按创建顺序
    std::vector<Pod> job_pods(const std::string& job_name) {
        std::vector<Pod> result;
        for (const auto& pod : sim->list<Pod>()) {
            auto label = pod.metadata.labels.find(LabelKeys::JOB_NAME);
            if (label != pod.metadata.labels.end() && label->second == job_name) {
                result.push_back(pod);
            }
        }
        return result;
    }

    int active_count(const std::string& job_name) {
        int count = 0;
        for (const auto& pod : job_pods(job_name)) {
            if (!pod.metadata.is_deleting() && !pod.is_terminal()) ++count;
        }
        return count;
    }

    std::unique_ptr<Simulator> sim;
};

TEST_F(JobTest, RunsToCompletion) {
    ASSERT_TRUE(sim->create(make_job("batch", 3, 2, 1)).ok());

    sim->tick();
    EXPECT_EQ(active_count("batch"), 2);

    // tick 5 前两个Pod成功，再补一个
    sim->run(4);
    auto job = sim->get<Job>("batch");
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status.succeeded, 2);
    EXPECT_EQ(job->status.active, 1);
    EXPECT_EQ(job->status.condition, JobCondition::None);

    sim->run(3);
    job = sim->get<Job>("batch");
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status.condition, JobCondition::None);

    sim->tick();
    job = sim->get<Job>("batch");
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status.condition, JobCondition::Complete);
    EXPECT_EQ(job->status.succeeded, 3);
    ASSERT_TRUE(job->status.completion_tick);
    EXPECT_EQ(*job->status.completion_tick, 9);
    EXPECT_EQ(job_pods("batch").size(), 3u);

    // 完成后不再创建Pod
    sim->run(5);
    EXPECT_EQ(job_pods("batch").size(), 3u);
}

TEST_F(JobTest, PodsCarryJobLabelAndCountdown) {
    Job batch = make_job("batch", 1, 1, 0);
    batch.spec.completion_ticks = 0;
    ASSERT_TRUE(sim->create(batch).ok());

    sim->tick();

    auto pods = job_pods("batch");
    ASSERT_EQ(pods.size(), 1u);
    EXPECT_EQ(pods[0].spec.completion_ticks, sim->config().default_job_completion_ticks);
    ASSERT_TRUE(pods[0].metadata.owner_reference);
    EXPECT_EQ(pods[0].metadata.owner_reference->kind, ResourceKind::Job);
}

TEST_F(JobTest, BackoffLimitExceeded) {
    ASSERT_TRUE(sim->create(make_job("batch", 3, 2, 1)).ok());
    sim->tick();

    auto pods = job_pods("batch");
    ASSERT_EQ(pods.size(), 2u);
    ASSERT_TRUE(sim->set_pod_failure(pods[0].metadata.name, FailureMode::ExitFailure).ok());

    // 第一次失败：计数并替换
    sim->run(4);
    auto job = sim->get<Job>("batch");
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status.failed, 1);
    EXPECT_EQ(job->status.succeeded, 1);
    EXPECT_EQ(job->status.condition, JobCondition::None);
    EXPECT_EQ(active_count("batch"), 2);

    pods = job_pods("batch");
    ASSERT_EQ(pods.size(), 4u);
    ASSERT_TRUE(sim->set_pod_failure(pods[2].metadata.name, FailureMode::ExitFailure).ok());

    // 第二次失败：超过backoffLimit
    sim->run(4);
    job = sim->get<Job>("batch");
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status.failed, 2);
    EXPECT_EQ(job->status.condition, JobCondition::Failed);
    EXPECT_EQ(sim->recorder().count("BackoffLimitExceeded"), 1u);

    sim->run(5);
    EXPECT_EQ(job_pods("batch").size(), 4u);
    EXPECT_EQ(active_count("batch"), 0);
    EXPECT_EQ(sim->recorder().count("BackoffLimitExceeded"), 1u);
}

TEST_F(JobTest, ZeroBackoffLimitFailsOnFirstFailure) {
    Job batch = make_job("batch", 2, 2, 0);
    ASSERT_TRUE(sim->create(batch).ok());
    sim->tick();

    auto pods = job_pods("batch");
    ASSERT_EQ(pods.size(), 2u);
    ASSERT_TRUE(sim->set_pod_failure(pods[1].metadata.name, FailureMode::ExitFailure).ok());
    sim->run(4);

    auto job = sim->get<Job>("batch");
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status.condition, JobCondition::Failed);
    EXPECT_EQ(job->status.failed, 1);
}

TEST_F(JobTest, CrashingPodsCountTowardBackoffLimit) {
    sim->add_failure_rule("crash:1", FailureMode::CrashLoopBackOff);
    Job batch = make_job("batch", 1, 1, 1);
    // 模板保留默认的Always
    batch.spec.template_.spec.restart_policy = RestartPolicy::Always;
    batch.spec.template_.spec.image = "crash:1";
    ASSERT_TRUE(sim->create(batch).ok());

    sim->run(12);

    auto job = sim->get<Job>("batch");
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status.condition, JobCondition::Failed);
    EXPECT_EQ(job->status.failed, 2);
    EXPECT_EQ(sim->recorder().count("BackoffLimitExceeded"), 1u);

    auto pods = job_pods("batch");
    ASSERT_EQ(pods.size(), 2u);
    for (const auto& pod : pods) {
        EXPECT_EQ(pod.spec.restart_policy, RestartPolicy::Never);
        EXPECT_EQ(pod.status.restart_count, 0);
        EXPECT_EQ(pod.status.phase, PodPhase::Failed);
    }
}

TEST_F(JobTest, ParallelismDecrease) {
    Job batch = make_job("batch", 4, 3, 1);
    batch.spec.completion_ticks = 10;
    ASSERT_TRUE(sim->create(batch).ok());
    sim->tick();
    ASSERT_EQ(active_count("batch"), 3);

    batch.spec.parallelism = 1;
    ASSERT_TRUE(sim->update(batch).ok());
    sim->tick();

    EXPECT_EQ(active_count("batch"), 1);
    auto job = sim->get<Job>("batch");
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status.active, 1);

    // 保留的是最早创建的Pod
    auto pods = job_pods("batch");
    ASSERT_EQ(pods.size(), 3u);
    EXPECT_FALSE(pods[0].metadata.is_deleting());
    EXPECT_TRUE(pods[1].metadata.is_deleting());
    EXPECT_TRUE(pods[2].metadata.is_deleting());
}

TEST_F(JobTest, RejectsInvalidSpec) {
    EXPECT_EQ(sim->create(make_job("batch", 0, 1, 1)).status, ApiStatus::Invalid);
    EXPECT_EQ(sim->create(make_job("batch", 1, 0, 1)).status, ApiStatus::Invalid);
    EXPECT_EQ(sim->create(make_job("batch", 1, 1, -1)).status, ApiStatus::Invalid);
}

class CronJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        SimulatorConfig config;
        config.log_level = "warn";
        config.node_pool.count = 2;
        sim = std::make_unique<Simulator>(config);
    }

    CronJob make_cron_job(const std::string& name, const std::string& schedule, ConcurrencyPolicy policy,
                          int32_t completion_ticks) {
        CronJob cron_job(name);
        cron_job.spec.schedule = schedule;
        cron_job.spec.concurrency_policy = policy;
        cron_job.spec.job_template.completion_ticks = completion_ticks;
        cron_job.spec.job_template.template_.labels = {{"app", name}};
        cron_job.spec.job_template.template_.spec.image = "busybox:1.36";
        cron_job.spec.job_template.template_.spec.restart_policy = RestartPolicy::OnFailure;
        return cron_job;
    }

    std::vector<std::string> live_jobs() {
        std::vector<std::string> names;
        for (const auto& job : sim->list<Job>()) {
            if (!job.metadata.is_deleting()) {
                names.push_back(job.metadata.name);
            }
        }
        return names;
    }

    std::unique_ptr<Simulator> sim;
};

TEST_F(CronJobTest, EveryNTicks) {
    ASSERT_TRUE(sim->create(make_cron_job("report", "every-5-ticks", ConcurrencyPolicy::Allow, 1)).ok());

    sim->run(4);
    EXPECT_TRUE(live_jobs().empty());

    sim->tick();
    EXPECT_EQ(live_jobs(), std::vector<std::string>({"report-5"}));

    auto job = sim->get<Job>("report-5");
    ASSERT_TRUE(job);
    ASSERT_TRUE(job->metadata.owner_reference);
    EXPECT_EQ(job->metadata.owner_reference->kind, ResourceKind::CronJob);

    auto cron_job = sim->get<CronJob>("report");
    ASSERT_TRUE(cron_job);
    ASSERT_TRUE(cron_job->status.last_schedule_tick);
    EXPECT_EQ(*cron_job->status.last_schedule_tick, 5);
    EXPECT_EQ(cron_job->status.active, 1);
}

TEST_F(CronJobTest, ForbidSkipsWhileActive) {
    ASSERT_TRUE(sim->create(make_cron_job("report", "every-5-ticks", ConcurrencyPolicy::Forbid, 10)).ok());

    sim->run(10);

    EXPECT_EQ(live_jobs(), std::vector<std::string>({"report-5"}));
    EXPECT_EQ(sim->recorder().count("JobAlreadyActive"), 1u);
}

TEST_F(CronJobTest, ReplaceDeletesActiveJob) {
    ASSERT_TRUE(sim->create(make_cron_job("report", "every-5-ticks", ConcurrencyPolicy::Replace, 10)).ok());

    sim->run(10);
    EXPECT_EQ(live_jobs(), std::vector<std::string>({"report-10"}));

    sim->tick();
    EXPECT_FALSE(sim->get<Job>("report-5"));
    for (const auto& pod : sim->list<Pod>()) {
        EXPECT_EQ(pod.metadata.labels.at(LabelKeys::JOB_NAME), "report-10");
    }
}

TEST_F(CronJobTest, AllowRunsConcurrently) {
    ASSERT_TRUE(sim->create(make_cron_job("report", "every-5-ticks", ConcurrencyPolicy::Allow, 10)).ok());

    sim->run(10);

    EXPECT_EQ(live_jobs(), std::vector<std::string>({"report-5", "report-10"}));
    auto cron_job = sim->get<CronJob>("report");
    ASSERT_TRUE(cron_job);
    EXPECT_EQ(cron_job->status.active, 2);
}

TEST_F(CronJobTest, HistoryIsPruned) {
    CronJob report = make_cron_job("report", "every-1-tick", ConcurrencyPolicy::Allow, 1);
    report.spec.successful_jobs_history_limit = 2;
    ASSERT_TRUE(sim->create(report).ok());

    sim->run(20);

    EXPECT_FALSE(sim->get<Job>("report-1"));
    int complete = 0;
    for (const auto& job : sim->list<Job>()) {
        if (!job.metadata.is_deleting() && job.status.condition == JobCondition::Complete) {
            ++complete;
        }
    }
    // 本tick刚完成的Job下个tick才会被清理
    EXPECT_LE(complete, 3);
    EXPECT_GT(sim->recorder().count("SuccessfulDelete"), 0u);
}

TEST_F(CronJobTest, SuspendStopsScheduling) {
    CronJob report = make_cron_job("report", "every-2-ticks", ConcurrencyPolicy::Allow, 1);
    report.spec.suspend = true;
    ASSERT_TRUE(sim->create(report).ok());

    sim->run(10);
    EXPECT_TRUE(sim->list<Job>().empty());

    report.spec.suspend = false;
    ASSERT_TRUE(sim->update(report).ok());
    sim->run(2);
    EXPECT_EQ(live_jobs(), std::vector<std::string>({"report-12"}));
}

TEST_F(CronJobTest, CronExpression) {
    ASSERT_TRUE(sim->create(make_cron_job("report", "*/15 * * * *", ConcurrencyPolicy::Forbid, 1)).ok());

    sim->run(30);

    // tick 0 是创建时刻，不触发
    EXPECT_FALSE(sim->get<Job>("report-0"));
    EXPECT_TRUE(sim->get<Job>("report-15"));
    EXPECT_TRUE(sim->get<Job>("report-30"));
}

TEST_F(CronJobTest, DeletionCascadesToJobsAndPods) {
    ASSERT_TRUE(sim->create(make_cron_job("report", "every-2-ticks", ConcurrencyPolicy::Allow, 10)).ok());
    sim->run(6);
    ASSERT_FALSE(live_jobs().empty());

    ASSERT_TRUE(sim->remove<CronJob>("report").ok());
    sim->run(3);

    EXPECT_FALSE(sim->get<CronJob>("report"));
    EXPECT_TRUE(sim->list<Job>().empty());
    EXPECT_TRUE(sim->list<Pod>().empty());
}

TEST_F(CronJobTest, RejectsInvalidSchedule) {
    auto response = sim->create(make_cron_job("report", "every-day", ConcurrencyPolicy::Forbid, 1));
    EXPECT_EQ(response.status, ApiStatus::Invalid);
    EXPECT_NE(response.message.find("invalid schedule"), std::string::npos);
}
