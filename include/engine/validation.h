#pragma once

#include <optional>
#include <string>
#include "api/types.h"
#include "api/workloads.h"

namespace kubesim {

// 校验失败时返回错误信息
using ValidationError = std::optional<std::string>;

ValidationError validate_name(const std::string& name);

ValidationError validate(const Node& node);
ValidationError validate(const Pod& pod);
ValidationError validate(const ReplicaSet& rs);
ValidationError validate(const Deployment& deployment);
ValidationError validate(const StatefulSet& sts);
ValidationError validate(const DaemonSet& ds);
ValidationError validate(const Job& job);
ValidationError validate(const CronJob& cron_job);
ValidationError validate(const HorizontalPodAutoscaler& hpa);
ValidationError validate(const PodDisruptionBudget& pdb);
ValidationError validate(const Service& service);
ValidationError validate(const StorageClass& storage_class);
ValidationError validate(const PersistentVolume& volume);
ValidationError validate(const PersistentVolumeClaim& claim);

} // namespace kubesim
