#pragma once

#include "controller/controller.h"

namespace kubesim {

// 两阶段删除：把删除标记级联到依赖对象，并物理移除依赖已清空的对象
class GarbageCollector : public Controller {
public:
    std::string name() const override { return "garbage-collector"; }
    void reconcile(TickContext& ctx) override;

private:
    template<typename T>
    void cascade(TickContext& ctx);

    template<typename T>
    int collect(TickContext& ctx);

    void mark_dependent(TickContext& ctx, const DependentRef& dependent);
};

} // namespace kubesim
