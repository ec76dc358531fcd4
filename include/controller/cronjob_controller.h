#pragma once

#include "controller/controller.h"

namespace kubesim {

// 按调度表达式创建Job "<name>-<tick>"
class CronJobController : public Controller {
public:
    std::string name() const override { return "cronjob-controller"; }
    void reconcile(TickContext& ctx) override;

private:
    void sync(TickContext& ctx, CronJob& cron_job);
    void create_job(TickContext& ctx, CronJob& cron_job);
    void prune_history(TickContext& ctx, CronJob& cron_job);
};

} // namespace kubesim
