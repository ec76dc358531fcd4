#include "controller/storage_controller.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace kubesim {

namespace {

// 没有对应的StorageClass时按Delete回收
ReclaimPolicy reclaim_policy_for(const ClusterStore& store, const PersistentVolume& volume) {
    const StorageClass* storage_class = store.get<StorageClass>(volume.spec.storage_class_name, "");
    return storage_class ? storage_class->spec.reclaim_policy : ReclaimPolicy::Delete;
}

// 预先通过claimRef指定给该PVC的卷
bool reserved_for(const PersistentVolume& volume, const PersistentVolumeClaim& claim) {
    const auto& ref = volume.spec.claim_ref;
    return ref && ref->name == claim.metadata.name && ref->namespace_ == claim.metadata.namespace_;
}

} // namespace

bool StorageController::volume_matches(const PersistentVolume& volume, const PersistentVolumeClaim& claim) {
    if (volume.metadata.is_deleting() || volume.status.phase != VolumePhase::Available) {
        return false;
    }
    if (volume.spec.claim_ref && !reserved_for(volume, claim)) {
        return false;
    }
    if (volume.spec.storage_class_name != claim.spec.storage_class_name) {
        return false;
    }

    auto capacity = parse_quantity(volume.spec.capacity);
    auto request = parse_quantity(claim.spec.request);
    if (!capacity || !request || *capacity < *request) {
        return false;
    }

    const auto& modes = volume.spec.access_modes;
    for (AccessMode mode : claim.spec.access_modes) {
        if (std::find(modes.begin(), modes.end(), mode) == modes.end()) {
            return false;
        }
    }
    return true;
}

// 优先预留给该PVC的卷，其次容量最小的卷，同容量按创建顺序
PersistentVolume* StorageController::find_volume(ClusterStore& store, const PersistentVolumeClaim& claim) const {
    PersistentVolume* best = nullptr;
    int64_t best_capacity = 0;
    for (PersistentVolume* volume : store.list<PersistentVolume>()) {
        if (!volume_matches(*volume, claim)) {
            continue;
        }
        if (reserved_for(*volume, claim)) {
            return volume;
        }
        int64_t capacity = parse_quantity(volume->spec.capacity).value_or(0);
        if (!best || capacity < best_capacity) {
            best = volume;
            best_capacity = capacity;
        }
    }
    return best;
}

void StorageController::bind(TickContext& ctx, PersistentVolume& volume, PersistentVolumeClaim& claim) {
    volume.spec.claim_ref = ClaimReference(claim.metadata.name, claim.metadata.namespace_, claim.metadata.uid);
    volume.status.phase = VolumePhase::Bound;

    claim.status.phase = ClaimPhase::Bound;
    claim.status.volume_name = volume.metadata.name;
    claim.status.capacity = volume.spec.capacity;

    spdlog::debug("[StorageController] bound {}/{} to {}", claim.metadata.namespace_, claim.metadata.name,
                  volume.metadata.name);
    ctx.normal(ResourceKind::PersistentVolumeClaim, claim.metadata.name, "Bound",
               "Bound to persistent volume " + volume.metadata.name);
}

void StorageController::release_volumes(TickContext& ctx) {
    for (PersistentVolume* volume : ctx.store.list<PersistentVolume>()) {
        const auto& ref = volume->spec.claim_ref;
        if (volume->status.phase != VolumePhase::Bound || !ref || ref->uid.empty()) {
            continue;
        }
        if (ctx.store.table<PersistentVolumeClaim>().find_by_uid(ref->uid)) {
            continue;
        }

        volume->status.phase = VolumePhase::Released;
        ctx.normal(ResourceKind::PersistentVolume, volume->metadata.name, "VolumeReleased",
                   "Claim " + ref->namespace_ + "/" + ref->name + " was deleted");
    }
}

void StorageController::reclaim_volumes(TickContext& ctx) {
    for (PersistentVolume* volume : ctx.store.list<PersistentVolume>()) {
        if (volume->status.phase != VolumePhase::Released || volume->metadata.is_deleting()) {
            continue;
        }
        // Retain：保持Released，等待手动清理
        if (reclaim_policy_for(ctx.store, *volume) != ReclaimPolicy::Delete) {
            continue;
        }

        mark_deleting(volume->metadata, ctx.tick);
        ctx.normal(ResourceKind::PersistentVolume, volume->metadata.name, "VolumeDeleted",
                   "Deleted released volume " + volume->metadata.name + " (reclaim policy Delete)");
    }
}

void StorageController::mark_lost_claims(TickContext& ctx) {
    for (PersistentVolumeClaim* claim : ctx.store.list<PersistentVolumeClaim>()) {
        if (claim->status.phase != ClaimPhase::Bound || claim->metadata.is_deleting()) {
            continue;
        }
        const PersistentVolume* volume = ctx.store.get<PersistentVolume>(claim->status.volume_name, "");
        if (volume && volume->spec.claim_ref && volume->spec.claim_ref->uid == claim->metadata.uid) {
            continue;
        }

        claim->status.phase = ClaimPhase::Lost;
        ctx.warning(ResourceKind::PersistentVolumeClaim, claim->metadata.name, "ClaimLost",
                    "Bound volume " + claim->status.volume_name + " no longer exists");
    }
}

void StorageController::bind_claims(TickContext& ctx) {
    unsatisfied_.clear();
    for (PersistentVolumeClaim* claim : ctx.store.list<PersistentVolumeClaim>()) {
        if (claim->status.phase != ClaimPhase::Pending || claim->metadata.is_deleting()) {
            continue;
        }

        if (PersistentVolume* volume = find_volume(ctx.store, *claim)) {
            bind(ctx, *volume, *claim);
            continue;
        }

        const std::string& class_name = claim->spec.storage_class_name;
        const StorageClass* storage_class = class_name.empty() ? nullptr : ctx.store.get<StorageClass>(class_name, "");
        if (storage_class && !storage_class->metadata.is_deleting()) {
            PersistentVolume volume(generate_name<PersistentVolume>(ctx.store, "pv-" + claim->metadata.name, ""),
                                    claim->spec.request);
            volume.spec.access_modes = claim->spec.access_modes;
            volume.spec.storage_class_name = class_name;
            volume.metadata.annotations["pv.kubernetes.io/provisioned-by"] = storage_class->spec.provisioner;

            PersistentVolume& created = ctx.store.add(std::move(volume), ctx.tick);
            ctx.normal(ResourceKind::PersistentVolumeClaim, claim->metadata.name, "Provisioned",
                       "Dynamically provisioned volume " + created.metadata.name + " via StorageClass " + class_name);
            bind(ctx, created, *claim);
            continue;
        }

        unsatisfied_.insert(claim->metadata.uid);
        if (reported_unsatisfied_.count(claim->metadata.uid)) {
            continue;
        }
        std::string message = class_name.empty()
            ? "no persistent volumes available for this claim and no storage class is set"
            : "storageclass \"" + class_name + "\" not found and no matching persistent volume is available";
        ctx.warning(ResourceKind::PersistentVolumeClaim, claim->metadata.name, "FailedBinding", message);
    }
    reported_unsatisfied_.swap(unsatisfied_);
}

void StorageController::reconcile(TickContext& ctx) {
    release_volumes(ctx);
    reclaim_volumes(ctx);
    mark_lost_claims(ctx);
    bind_claims(ctx);
}

} // namespace kubesim
