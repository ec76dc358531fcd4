#pragma once

#include "controller/controller.h"

namespace kubesim {

// Pod状态机：Pending -> Running -> {Succeeded, Failed}，探针与故障注入
class PodLifecycle : public Controller {
public:
    std::string name() const override { return "pod-lifecycle"; }
    void reconcile(TickContext& ctx) override;

    // 按镜像注入故障，作用于尚未指定故障的Pending Pod
    void add_failure_rule(const std::string& image, FailureMode mode);
    bool remove_failure_rule(const std::string& image);
    const std::map<std::string, FailureMode>& failure_rules() const { return failure_rules_; }

    static bool probe_due(const Probe& probe, Tick age);

private:
    void advance_pending(TickContext& ctx, Pod& pod);
    void advance_running(TickContext& ctx, Pod& pod);
    // 返回true表示init容器已全部完成
    bool step_init_containers(TickContext& ctx, Pod& pod);
    void start(TickContext& ctx, Pod& pod);
    void restart(TickContext& ctx, Pod& pod, const std::string& reason);
    void fail(TickContext& ctx, Pod& pod, const std::string& reason, const std::string& message);

    std::map<std::string, FailureMode> failure_rules_;
};

} // namespace kubesim
