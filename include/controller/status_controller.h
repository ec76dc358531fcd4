#pragma once

#include "controller/controller.h"

namespace kubesim {

// 每个tick末尾汇总状态：工作负载计数、Service端点、PDB余量、节点分配
class StatusController : public Controller {
public:
    std::string name() const override { return "status-controller"; }
    void reconcile(TickContext& ctx) override;

    static std::vector<std::string> compute_endpoints(ClusterStore& store, const Service& service);

private:
    void update_endpoints(TickContext& ctx, Service& service);
};

// 集群不变量检查，违反时抛出InvariantViolation
class InvariantChecker : public Controller {
public:
    std::string name() const override { return "invariant-checker"; }
    void reconcile(TickContext& ctx) override;

    static void check(const ClusterStore& store);

private:
    static void check_nodes(const ClusterStore& store);
    static void check_owners(const ClusterStore& store);
    static void check_stateful_sets(const ClusterStore& store);
    static void check_jobs(const ClusterStore& store);
};

} // namespace kubesim
