#pragma once

#include "controller/controller.h"

namespace kubesim {

// 驱逐NotReady节点、已删除节点以及带有不被容忍的NoExecute污点节点上的Pod
class NodeLifecycle : public Controller {
public:
    std::string name() const override { return "node-lifecycle"; }
    void reconcile(TickContext& ctx) override;
};

} // namespace kubesim
