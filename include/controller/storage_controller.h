#pragma once

#include <set>
#include "controller/controller.h"

namespace kubesim {

// PVC绑定、按StorageClass动态供给PV、回收已释放的PV；在调度之前运行
class StorageController : public Controller {
public:
    std::string name() const override { return "storage-controller"; }
    void reconcile(TickContext& ctx) override;

    // 卷能否满足该PVC：同一StorageClass、容量足够、访问模式全部支持、未被其他PVC预留
    static bool volume_matches(const PersistentVolume& volume, const PersistentVolumeClaim& claim);

private:
    void release_volumes(TickContext& ctx);
    void reclaim_volumes(TickContext& ctx);
    void mark_lost_claims(TickContext& ctx);
    void bind_claims(TickContext& ctx);

    PersistentVolume* find_volume(ClusterStore& store, const PersistentVolumeClaim& claim) const;
    void bind(TickContext& ctx, PersistentVolume& volume, PersistentVolumeClaim& claim);

    // 本tick与上一tick无法满足的PVC uid，只在首次出现时告警
    std::set<std::string> unsatisfied_;
    std::set<std::string> reported_unsatisfied_;
};

} // namespace kubesim
