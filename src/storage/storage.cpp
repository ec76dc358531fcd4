#include "storage/storage.h"
#include <algorithm>
#include <sstream>

namespace kubesim {

// ObjectTable实现
template<typename T>
std::string ObjectTable<T>::generate_key(const std::string& name, const std::string& namespace_) {
    std::ostringstream oss;
    oss << namespace_ << "/" << name;
    return oss.str();
}

template<typename T>
T* ObjectTable<T>::find(const std::string& name, const std::string& namespace_) {
    auto it = by_key_.find(generate_key(name, namespace_));
    if (it != by_key_.end()) {
        return &objects_.at(it->second);
    }
    return nullptr;
}

template<typename T>
const T* ObjectTable<T>::find(const std::string& name, const std::string& namespace_) const {
    auto it = by_key_.find(generate_key(name, namespace_));
    if (it != by_key_.end()) {
        return &objects_.at(it->second);
    }
    return nullptr;
}

template<typename T>
T* ObjectTable<T>::find_by_uid(const std::string& uid) {
    auto it = by_uid_.find(uid);
    if (it != by_uid_.end()) {
        return &objects_.at(it->second);
    }
    return nullptr;
}

template<typename T>
const T* ObjectTable<T>::find_by_uid(const std::string& uid) const {
    auto it = by_uid_.find(uid);
    if (it != by_uid_.end()) {
        return &objects_.at(it->second);
    }
    return nullptr;
}

template<typename T>
bool ObjectTable<T>::contains(const std::string& name, const std::string& namespace_) const {
    return by_key_.find(generate_key(name, namespace_)) != by_key_.end();
}

template<typename T>
T& ObjectTable<T>::insert(T obj) {
    uint64_t sequence = obj.metadata.creation_sequence;
    by_uid_[obj.metadata.uid] = sequence;
    by_key_[generate_key(obj.metadata.name, obj.metadata.namespace_)] = sequence;
    auto result = objects_.emplace(sequence, std::move(obj));
    return result.first->second;
}

template<typename T>
bool ObjectTable<T>::erase(const std::string& uid) {
    auto it = by_uid_.find(uid);
    if (it == by_uid_.end()) {
        return false; // 不存在
    }

    auto obj_it = objects_.find(it->second);
    by_key_.erase(generate_key(obj_it->second.metadata.name, obj_it->second.metadata.namespace_));
    objects_.erase(obj_it);
    by_uid_.erase(it);
    return true;
}

template<typename T>
std::vector<T*> ObjectTable<T>::items() {
    std::vector<T*> result;
    result.reserve(objects_.size());
    for (auto& [sequence, obj] : objects_) {
        result.push_back(&obj);
    }
    return result;
}

template<typename T>
std::vector<const T*> ObjectTable<T>::items() const {
    std::vector<const T*> result;
    result.reserve(objects_.size());
    for (const auto& [sequence, obj] : objects_) {
        result.push_back(&obj);
    }
    return result;
}

template<typename T>
void ObjectTable<T>::clear() {
    objects_.clear();
    by_uid_.clear();
    by_key_.clear();
}

// ClusterStore实现
template<typename T>
T& ClusterStore::add(T obj, Tick now) {
    ++sequence_;
    obj.metadata.creation_sequence = sequence_;
    obj.metadata.creation_tick = now;
    obj.metadata.uid = ObjectMeta::generate_uid(T::KIND, obj.metadata.namespace_,
                                                obj.metadata.name, sequence_);
    obj.metadata.deletion_tick.reset();

    T& stored = table<T>().insert(std::move(obj));
    index_owner(stored.metadata, T::KIND);
    return stored;
}

template<typename T>
bool ClusterStore::remove(const std::string& uid) {
    T* obj = table<T>().find_by_uid(uid);
    if (!obj) {
        return false;
    }

    unindex_owner(obj->metadata);
    return table<T>().erase(uid);
}

template<typename T>
std::vector<T*> ClusterStore::owned_by(const std::string& owner_uid) {
    std::vector<T*> result;
    auto it = owner_index_.find(owner_uid);
    if (it == owner_index_.end()) {
        return result;
    }

    for (const auto& [sequence, dependent] : it->second) {
        if (dependent.kind != T::KIND) {
            continue;
        }
        T* obj = table<T>().find_by_uid(dependent.uid);
        if (obj) {
            result.push_back(obj);
        }
    }
    return result;
}

void ClusterStore::set_owner(ObjectMeta& meta, ResourceKind kind, const OwnerReference& owner) {
    unindex_owner(meta);
    meta.owner_reference = owner;
    index_owner(meta, kind);
}

std::vector<DependentRef> ClusterStore::dependents(const std::string& owner_uid) const {
    std::vector<DependentRef> result;
    auto it = owner_index_.find(owner_uid);
    if (it != owner_index_.end()) {
        for (const auto& [sequence, dependent] : it->second) {
            result.push_back(dependent);
        }
    }
    return result;
}

bool ClusterStore::has_dependents(const std::string& owner_uid) const {
    auto it = owner_index_.find(owner_uid);
    return it != owner_index_.end() && !it->second.empty();
}

size_t ClusterStore::total_objects() const {
    return nodes_.size() + pods_.size() + replica_sets_.size() + deployments_.size() +
           stateful_sets_.size() + daemon_sets_.size() + jobs_.size() + cron_jobs_.size() +
           autoscalers_.size() + disruption_budgets_.size() + services_.size() +
           storage_classes_.size() + volumes_.size() + claims_.size();
}

void ClusterStore::clear() {
    nodes_.clear();
    pods_.clear();
    replica_sets_.clear();
    deployments_.clear();
    stateful_sets_.clear();
    daemon_sets_.clear();
    jobs_.clear();
    cron_jobs_.clear();
    autoscalers_.clear();
    disruption_budgets_.clear();
    services_.clear();
    storage_classes_.clear();
    volumes_.clear();
    claims_.clear();
    owner_index_.clear();
    sequence_ = 0;
}

void ClusterStore::index_owner(const ObjectMeta& meta, ResourceKind kind) {
    if (!meta.owner_reference) {
        return;
    }
    DependentRef ref{kind, meta.uid, meta.creation_sequence};
    owner_index_[meta.owner_reference->uid][meta.creation_sequence] = ref;
}

void ClusterStore::unindex_owner(const ObjectMeta& meta) {
    if (!meta.owner_reference) {
        return;
    }
    auto it = owner_index_.find(meta.owner_reference->uid);
    if (it == owner_index_.end()) {
        return;
    }
    it->second.erase(meta.creation_sequence);
    if (it->second.empty()) {
        owner_index_.erase(it);
    }
}

// 显式实例化
template class ObjectTable<Node>;
template class ObjectTable<Pod>;
template class ObjectTable<ReplicaSet>;
template class ObjectTable<Deployment>;
template class ObjectTable<StatefulSet>;
template class ObjectTable<DaemonSet>;
template class ObjectTable<Job>;
template class ObjectTable<CronJob>;
template class ObjectTable<HorizontalPodAutoscaler>;
template class ObjectTable<PodDisruptionBudget>;
template class ObjectTable<Service>;
template class ObjectTable<StorageClass>;
template class ObjectTable<PersistentVolume>;
template class ObjectTable<PersistentVolumeClaim>;

#define KUBESIM_INSTANTIATE_STORE(T)                                              \
    template T& ClusterStore::add<T>(T obj, Tick now);                            \
    template bool ClusterStore::remove<T>(const std::string& uid);                \
    template std::vector<T*> ClusterStore::owned_by<T>(const std::string& owner_uid);

KUBESIM_INSTANTIATE_STORE(Node)
KUBESIM_INSTANTIATE_STORE(Pod)
KUBESIM_INSTANTIATE_STORE(ReplicaSet)
KUBESIM_INSTANTIATE_STORE(Deployment)
KUBESIM_INSTANTIATE_STORE(StatefulSet)
KUBESIM_INSTANTIATE_STORE(DaemonSet)
KUBESIM_INSTANTIATE_STORE(Job)
KUBESIM_INSTANTIATE_STORE(CronJob)
KUBESIM_INSTANTIATE_STORE(HorizontalPodAutoscaler)
KUBESIM_INSTANTIATE_STORE(PodDisruptionBudget)
KUBESIM_INSTANTIATE_STORE(Service)
KUBESIM_INSTANTIATE_STORE(StorageClass)
KUBESIM_INSTANTIATE_STORE(PersistentVolume)
KUBESIM_INSTANTIATE_STORE(PersistentVolumeClaim)

#undef KUBESIM_INSTANTIATE_STORE

} // namespace kubesim
