#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace kubesim {

// 模拟时钟：一个tick即一次完整的调和
using Tick = int64_t;

// 标签集合（键有序，与插入顺序无关）
using Labels = std::map<std::string, std::string>;

// 资源类型
enum class ResourceKind {
    Node,
    Pod,
    ReplicaSet,
    Deployment,
    StatefulSet,
    DaemonSet,
    Job,
    CronJob,
    HorizontalPodAutoscaler,
    PodDisruptionBudget,
    Service,
    StorageClass,
    PersistentVolume,
    PersistentVolumeClaim
};

// 属主引用：只记录身份，不持有生命周期
struct OwnerReference {
    ResourceKind kind;
    std::string name;
    std::string uid;

    OwnerReference() : kind(ResourceKind::Pod) {}
    OwnerReference(ResourceKind k, const std::string& n, const std::string& u)
        : kind(k), name(n), uid(u) {}

    bool operator==(const OwnerReference& other) const {
        return kind == other.kind && name == other.name && uid == other.uid;
    }
};

// 对象元数据
class ObjectMeta {
public:
    std::string name;
    std::string namespace_;
    std::string uid;
    Labels labels;
    Labels annotations;
    std::optional<OwnerReference> owner_reference;
    std::optional<Tick> deletion_tick;
    Tick creation_tick;
    uint64_t creation_sequence;

    ObjectMeta() : namespace_("default"), creation_tick(0), creation_sequence(0) {}
    ObjectMeta(const std::string& name, const std::string& ns = "default")
        : name(name), namespace_(ns), creation_tick(0), creation_sequence(0) {}

    bool is_deleting() const { return deletion_tick.has_value(); }
    bool is_owned_by(const std::string& owner_uid) const {
        return owner_reference && owner_reference->uid == owner_uid;
    }

    void to_json(nlohmann::json& j) const;

    // 基于名字的确定性UID：同样的输入历史得到同样的UID
    static std::string generate_uid(ResourceKind kind, const std::string& ns,
                                    const std::string& name, uint64_t sequence);
};

// ---------------------------------------------------------------------------
// Node
// ---------------------------------------------------------------------------

enum class TaintEffect {
    NoSchedule,
    PreferNoSchedule,
    NoExecute
};

struct Taint {
    std::string key;
    std::string value;
    TaintEffect effect;

    Taint() : effect(TaintEffect::NoSchedule) {}
    Taint(const std::string& k, const std::string& v, TaintEffect e)
        : key(k), value(v), effect(e) {}

    bool operator==(const Taint& other) const {
        return key == other.key && value == other.value && effect == other.effect;
    }
};

class NodeSpec {
public:
    int32_t capacity_pods;
    bool unschedulable;
    std::vector<Taint> taints;

    NodeSpec() : capacity_pods(10), unschedulable(false) {}

    void to_json(nlohmann::json& j) const;
};

class NodeStatus {
public:
    bool ready;
    int32_t allocated_pods;

    NodeStatus() : ready(true), allocated_pods(0) {}

    void to_json(nlohmann::json& j) const;
};

class Node {
public:
    static constexpr ResourceKind KIND = ResourceKind::Node;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    NodeSpec spec;
    NodeStatus status;

    Node() : api_version("v1"), kind("Node") { metadata.namespace_.clear(); }

    Node(const std::string& name, int32_t capacity = 10)
        : api_version("v1"), kind("Node"), metadata(name, "") {
        spec.capacity_pods = capacity;
    }

    void to_json(nlohmann::json& j) const;

    bool operator==(const Node& other) const {
        return metadata.uid == other.metadata.uid;
    }
};

// ---------------------------------------------------------------------------
// Pod
// ---------------------------------------------------------------------------

enum class PodPhase {
    Pending,
    Running,
    Succeeded,
    Failed,
    Terminating
};

enum class TolerationOperator {
    Equal,
    Exists
};

struct Toleration {
    std::string key;
    TolerationOperator operator_;
    std::string value;
    std::optional<TaintEffect> effect;

    Toleration() : operator_(TolerationOperator::Equal) {}
    Toleration(const std::string& k, TolerationOperator op, const std::string& v = "",
               std::optional<TaintEffect> e = std::nullopt)
        : key(k), operator_(op), value(v), effect(e) {}
};

enum class ProbeType {
    HttpGet,
    TcpSocket,
    Exec
};

// 探针配置，时间单位均为tick
struct Probe {
    ProbeType type;
    std::string target;
    int32_t initial_delay_ticks;
    int32_t period_ticks;
    int32_t failure_threshold;

    Probe() : type(ProbeType::HttpGet), initial_delay_ticks(0), period_ticks(1), failure_threshold(3) {}
    Probe(ProbeType t, const std::string& tgt, int32_t delay = 0, int32_t period = 1, int32_t threshold = 3)
        : type(t), target(tgt), initial_delay_ticks(delay), period_ticks(period), failure_threshold(threshold) {}
};

struct InitContainer {
    std::string name;
    std::string image;
    bool fails;

    InitContainer() : fails(false) {}
    InitContainer(const std::string& n, const std::string& img, bool f = false)
        : name(n), image(img), fails(f) {}
};

enum class RestartPolicy {
    Always,
    OnFailure,
    Never
};

// 注入的故障
enum class FailureMode {
    None,
    ImagePullError,
    CrashLoopBackOff,
    OOMKilled,
    LivenessFailure,
    ReadinessFailure,
    StartupFailure,
    ExitFailure
};

class PodSpec {
public:
    std::string image;
    std::string node_name;
    // 只允许调度到该节点（DaemonSet使用）
    std::string required_node;
    std::vector<Toleration> tolerations;
    std::optional<Probe> startup_probe;
    std::optional<Probe> readiness_probe;
    std::optional<Probe> liveness_probe;
    std::vector<InitContainer> init_containers;
    RestartPolicy restart_policy;
    FailureMode failure_mode;
    // Job Pod运行多少tick后结束，0表示长期运行
    int32_t completion_ticks;
    // StatefulSet序号
    std::optional<int32_t> ordinal;
    // 引用的PVC名（同命名空间），全部Bound后才能调度
    std::vector<std::string> claim_names;

    PodSpec() : restart_policy(RestartPolicy::Always), failure_mode(FailureMode::None), completion_ticks(0) {}
    explicit PodSpec(const std::string& img)
        : image(img), restart_policy(RestartPolicy::Always), failure_mode(FailureMode::None), completion_ticks(0) {}

    void to_json(nlohmann::json& j) const;
};

enum class InitContainerState {
    Waiting,
    Running,
    Completed,
    Failed
};

struct InitContainerStatus {
    std::string name;
    InitContainerState state;

    InitContainerStatus() : state(InitContainerState::Waiting) {}
    explicit InitContainerStatus(const std::string& n) : name(n), state(InitContainerState::Waiting) {}
};

class PodStatus {
public:
    PodPhase phase;
    bool ready;
    int32_t restart_count;
    std::string reason;
    std::string message;
    // 创建或最近一次重启的tick
    Tick start_tick;
    Tick backoff_until;
    std::optional<Tick> running_since;
    std::optional<int32_t> completion_remaining;
    std::vector<InitContainerStatus> init_container_statuses;
    bool startup_probe_succeeded;
    int32_t startup_failures;
    int32_t readiness_failures;
    int32_t liveness_failures;
    std::optional<double> cpu_utilization;

    PodStatus()
        : phase(PodPhase::Pending), ready(false), restart_count(0), start_tick(0), backoff_until(0),
          startup_probe_succeeded(false), startup_failures(0), readiness_failures(0), liveness_failures(0) {}

    void to_json(nlohmann::json& j) const;
};

class Pod {
public:
    static constexpr ResourceKind KIND = ResourceKind::Pod;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    PodSpec spec;
    PodStatus status;

    Pod() : api_version("v1"), kind("Pod") {}

    Pod(const std::string& name, const std::string& ns = "default")
        : api_version("v1"), kind("Pod"), metadata(name, ns) {}

    bool is_terminal() const {
        return status.phase == PodPhase::Succeeded || status.phase == PodPhase::Failed;
    }
    // Running且就绪，且未被标记删除
    bool is_healthy() const {
        return !metadata.is_deleting() && status.phase == PodPhase::Running && status.ready;
    }

    void to_json(nlohmann::json& j) const;

    bool operator==(const Pod& other) const {
        return metadata.uid == other.metadata.uid;
    }
};

// Pod模板
class PodTemplate {
public:
    Labels labels;
    PodSpec spec;

    PodTemplate() = default;
    PodTemplate(const Labels& l, const PodSpec& s) : labels(l), spec(s) {}

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// Service
// ---------------------------------------------------------------------------

class ServiceSpec {
public:
    Labels selector;
    int32_t port;

    ServiceSpec() : port(80) {}

    void to_json(nlohmann::json& j) const;
};

class ServiceStatus {
public:
    std::vector<std::string> endpoints;

    void to_json(nlohmann::json& j) const;
};

class Service {
public:
    static constexpr ResourceKind KIND = ResourceKind::Service;

    std::string api_version;
    std::string kind;
    ObjectMeta metadata;
    ServiceSpec spec;
    ServiceStatus status;

    Service() : api_version("v1"), kind("Service") {}
    Service(const std::string& name, const std::string& ns = "default")
        : api_version("v1"), kind("Service"), metadata(name, ns) {}

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// 事件
// ---------------------------------------------------------------------------

enum class EventType {
    Normal,
    Warning
};

struct Event {
    Tick tick;
    EventType type;
    std::string reason;
    ResourceKind object_kind;
    std::string object_name;
    std::string message;

    Event() : tick(0), type(EventType::Normal), object_kind(ResourceKind::Pod) {}
    Event(Tick t, EventType ty, const std::string& r, ResourceKind k, const std::string& n, const std::string& m)
        : tick(t), type(ty), reason(r), object_kind(k), object_name(n), message(m) {}

    void to_json(nlohmann::json& j) const;
};

// ---------------------------------------------------------------------------
// API结果
// ---------------------------------------------------------------------------

enum class ApiStatus {
    Success,
    Failure,
    NotFound,
    AlreadyExists,
    Invalid
};

template<typename T>
class ApiResponse {
public:
    ApiStatus status;
    std::string message;
    std::optional<T> data;

    ApiResponse() : status(ApiStatus::Success) {}

    bool ok() const { return status == ApiStatus::Success; }

    static ApiResponse<T> success(const T& data, const std::string& msg = "") {
        ApiResponse<T> response;
        response.status = ApiStatus::Success;
        response.data = data;
        response.message = msg;
        return response;
    }

    static ApiResponse<T> error(ApiStatus status, const std::string& msg) {
        ApiResponse<T> response;
        response.status = status;
        response.message = msg;
        return response;
    }

    void to_json(nlohmann::json& j) const {
        j = nlohmann::json{
            {"status", static_cast<int>(status)},
            {"message", message}
        };
        if (data) {
            nlohmann::json data_json;
            data->to_json(data_json);
            j["data"] = data_json;
        }
    }
};

// 常用标签
namespace LabelKeys {
    constexpr const char* POD_TEMPLATE_HASH = "pod-template-hash";
    constexpr const char* POD_INDEX = "apps.kubernetes.io/pod-index";
    constexpr const char* JOB_NAME = "job-name";
}

// 便捷函数
std::string kind_to_string(ResourceKind kind);
std::string phase_to_string(PodPhase phase);
PodPhase string_to_pod_phase(const std::string& str);
std::string effect_to_string(TaintEffect effect);
std::optional<TaintEffect> string_to_taint_effect(const std::string& str);
std::string probe_type_to_string(ProbeType type);
std::string failure_mode_to_string(FailureMode mode);
std::optional<FailureMode> string_to_failure_mode(const std::string& str);
std::string event_type_to_string(EventType type);
std::string status_to_string(ApiStatus status);

} // namespace kubesim
