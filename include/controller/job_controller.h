#pragma once

#include "controller/controller.h"

namespace kubesim {

// 运行Pod直到成功次数达到completions，失败超过backoffLimit则放弃
class JobController : public Controller {
public:
    std::string name() const override { return "job-controller"; }
    void reconcile(TickContext& ctx) override;

    static int32_t count_active(ClusterStore& store, const Job& job);

    // 已计入status的Pod打上该注解
    static constexpr const char* TRACKED_ANNOTATION = "batch.kubernetes.io/tracked";

private:
    void sync(TickContext& ctx, Job& job);
    void terminate_active(TickContext& ctx, Job& job);
};

} // namespace kubesim
