#pragma once

#include <map>
#include <unordered_map>
#include <vector>
#include <optional>
#include "api/types.h"
#include "api/workloads.h"

namespace kubesim {

// 单一类型的对象表：按创建序号有序存放，另有uid和"ns/name"索引
template<typename T>
class ObjectTable {
public:
    ObjectTable() = default;

    T* find(const std::string& name, const std::string& namespace_);
    const T* find(const std::string& name, const std::string& namespace_) const;
    T* find_by_uid(const std::string& uid);
    const T* find_by_uid(const std::string& uid) const;
    bool contains(const std::string& name, const std::string& namespace_) const;

    // 插入已分配uid和序号的对象
    T& insert(T obj);
    bool erase(const std::string& uid);

    // 按创建顺序
    std::vector<T*> items();
    std::vector<const T*> items() const;

    size_t size() const { return objects_.size(); }
    void clear();

private:
    static std::string generate_key(const std::string& name, const std::string& namespace_);

    std::map<uint64_t, T> objects_;
    std::unordered_map<std::string, uint64_t> by_uid_;
    std::unordered_map<std::string, uint64_t> by_key_;
};

// 依赖对象在属主索引中的条目
struct DependentRef {
    ResourceKind kind;
    std::string uid;
    uint64_t sequence;
};

// 集群存储：所有资源类型的表，以及属主到依赖对象的索引
class ClusterStore {
public:
    ClusterStore() : sequence_(0) {}

    template<typename T>
    ObjectTable<T>& table() {
        if constexpr (T::KIND == ResourceKind::Node) return nodes_;
        else if constexpr (T::KIND == ResourceKind::Pod) return pods_;
        else if constexpr (T::KIND == ResourceKind::ReplicaSet) return replica_sets_;
        else if constexpr (T::KIND == ResourceKind::Deployment) return deployments_;
        else if constexpr (T::KIND == ResourceKind::StatefulSet) return stateful_sets_;
        else if constexpr (T::KIND == ResourceKind::DaemonSet) return daemon_sets_;
        else if constexpr (T::KIND == ResourceKind::Job) return jobs_;
        else if constexpr (T::KIND == ResourceKind::CronJob) return cron_jobs_;
        else if constexpr (T::KIND == ResourceKind::HorizontalPodAutoscaler) return autoscalers_;
        else if constexpr (T::KIND == ResourceKind::PodDisruptionBudget) return disruption_budgets_;
        else if constexpr (T::KIND == ResourceKind::StorageClass) return storage_classes_;
        else if constexpr (T::KIND == ResourceKind::PersistentVolume) return volumes_;
        else if constexpr (T::KIND == ResourceKind::PersistentVolumeClaim) return claims_;
        else return services_;
    }

    template<typename T>
    const ObjectTable<T>& table() const {
        return const_cast<ClusterStore*>(this)->table<T>();
    }

    // 分配uid、创建序号与创建tick，登记属主索引
    template<typename T>
    T& add(T obj, Tick now);

    // 物理删除，同时清理属主索引
    template<typename T>
    bool remove(const std::string& uid);

    template<typename T>
    T* get(const std::string& name, const std::string& namespace_ = "default") {
        return table<T>().find(name, namespace_);
    }

    template<typename T>
    const T* get(const std::string& name, const std::string& namespace_ = "default") const {
        return table<T>().find(name, namespace_);
    }

    template<typename T>
    std::vector<T*> list() { return table<T>().items(); }

    template<typename T>
    std::vector<const T*> list() const { return table<T>().items(); }

    // 某属主下指定类型的依赖对象，按创建顺序
    template<typename T>
    std::vector<T*> owned_by(const std::string& owner_uid);

    // 认领孤儿对象
    void set_owner(ObjectMeta& meta, ResourceKind kind, const OwnerReference& owner);
    std::vector<DependentRef> dependents(const std::string& owner_uid) const;
    bool has_dependents(const std::string& owner_uid) const;

    uint64_t last_sequence() const { return sequence_; }
    size_t total_objects() const;
    void clear();

private:
    void index_owner(const ObjectMeta& meta, ResourceKind kind);
    void unindex_owner(const ObjectMeta& meta);

    ObjectTable<Node> nodes_;
    ObjectTable<Pod> pods_;
    ObjectTable<ReplicaSet> replica_sets_;
    ObjectTable<Deployment> deployments_;
    ObjectTable<StatefulSet> stateful_sets_;
    ObjectTable<DaemonSet> daemon_sets_;
    ObjectTable<Job> jobs_;
    ObjectTable<CronJob> cron_jobs_;
    ObjectTable<HorizontalPodAutoscaler> autoscalers_;
    ObjectTable<PodDisruptionBudget> disruption_budgets_;
    ObjectTable<Service> services_;
    ObjectTable<StorageClass> storage_classes_;
    ObjectTable<PersistentVolume> volumes_;
    ObjectTable<PersistentVolumeClaim> claims_;

    // owner uid -> (creation sequence -> dependent)
    std::unordered_map<std::string, std::map<uint64_t, DependentRef>> owner_index_;
    uint64_t sequence_;
};

} // namespace kubesim
