#pragma once

#include <memory>
#include <vector>
#include "api/types.h"
#include "api/workloads.h"
#include "storage/storage.h"
#include "engine/config.h"
#include "engine/event_recorder.h"
#include "controller/controller.h"
#include "controller/disruption_controller.h"

namespace kubesim {

class PodLifecycle;

// 模拟器入口：持有集群存储和控制器流水线，所有变更都经过这里
class Simulator {
public:
    explicit Simulator(const SimulatorConfig& config = SimulatorConfig());
    ~Simulator();

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    // 通用资源操作
    template<typename T>
    ApiResponse<T> create(const T& obj);

    template<typename T>
    ApiResponse<T> update(const T& obj);

    // 两阶段删除：先打删除标记
    template<typename T>
    ApiResponse<T> remove(const std::string& name, const std::string& namespace_ = "default");

    template<typename T>
    std::optional<T> get(const std::string& name, const std::string& namespace_ = "default") const;

    // namespace_为空时返回所有命名空间
    template<typename T>
    std::vector<T> list(const std::string& namespace_ = "") const;

    // 便捷操作
    template<typename T>
    ApiResponse<T> scale(const std::string& name, int32_t replicas, const std::string& namespace_ = "default");

    ApiResponse<Deployment> set_image(const std::string& deployment, const std::string& image,
                                      const std::string& namespace_ = "default");
    ApiResponse<Deployment> rollout_undo(const std::string& deployment, const std::string& namespace_ = "default");

    ApiResponse<Node> cordon(const std::string& node);
    ApiResponse<Node> uncordon(const std::string& node);
    ApiResponse<Node> set_node_ready(const std::string& node, bool ready);
    ApiResponse<Node> add_taint(const std::string& node, const Taint& taint);
    ApiResponse<Node> remove_taint(const std::string& node, const std::string& key,
                                   std::optional<TaintEffect> effect = std::nullopt);

    ApiResponse<Pod> set_pod_failure(const std::string& pod, FailureMode mode,
                                     const std::string& namespace_ = "default");
    void add_failure_rule(const std::string& image, FailureMode mode);
    bool remove_failure_rule(const std::string& image);

    // 指标输入
    ApiResponse<Pod> report_cpu(const std::string& pod, double percent, const std::string& namespace_ = "default");

    // 驱逐
    ApiResponse<EvictionResult> evict_pod(const std::string& pod, const std::string& namespace_ = "default");
    ApiResponse<DrainResult> drain_node(const std::string& node);

    // 一次完整调和
    void tick();
    void run(int ticks);
    Tick current_tick() const { return tick_; }

    // 只读查询
    const std::deque<Event>& events() const { return recorder_.events(); }
    const EventRecorder& recorder() const { return recorder_; }
    std::vector<std::string> service_endpoints(const std::string& service,
                                               const std::string& namespace_ = "default") const;
    nlohmann::json snapshot() const;
    void check_invariants() const;

    const SimulatorConfig& config() const { return config_; }
    const ClusterStore& store() const { return store_; }

private:
    TickContext context();

    template<typename T>
    ApiResponse<T> validated(const T& obj) const;

    SimulatorConfig config_;
    ClusterStore store_;
    EventRecorder recorder_;
    Tick tick_;

    std::vector<std::unique_ptr<Controller>> pipeline_;
    PodLifecycle* lifecycle_;
    DisruptionController disruption_;
};

} // namespace kubesim
