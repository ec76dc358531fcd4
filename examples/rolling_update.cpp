#include "engine/simulator.h"
#include <iostream>

using namespace kubesim;

namespace {

void print_replica_sets(const Simulator& simulator) {
    for (const auto& rs : simulator.list<ReplicaSet>()) {
        std::cout << "    " << rs.metadata.name << ": " << rs.status.replicas << " pods, "
                  << rs.status.ready_replicas << " ready" << std::endl;
    }
}

} // namespace

int main() {
    std::cout << "=== kubesim 滚动更新示例 ===" << std::endl;

    SimulatorConfig config;
    config.log_level = "warn";
    config.node_pool.count = 2;
    config.node_pool.capacity_pods = 4;
    Simulator simulator(config);

    // 创建Deployment
    std::cout << "\n1. 创建Deployment web (3副本, nginx:1.0)..." << std::endl;
    Deployment web("web");
    web.spec.replicas = 3;
    web.spec.selector = {{"app", "web"}};
    web.spec.template_.labels = {{"app", "web"}};
    web.spec.template_.spec.image = "nginx:1.0";
    web.spec.strategy.max_surge = 1;
    web.spec.strategy.max_unavailable = 1;

    auto created = simulator.create(web);
    if (!created.ok()) {
        std::cerr << "✗ " << created.message << std::endl;
        return 1;
    }
    std::cout << "✓ Deployment web 创建成功" << std::endl;

    Service service("web");
    service.spec.selector = {{"app", "web"}};
    if (!simulator.create(service).ok()) {
        std::cerr << "✗ Service web 创建失败" << std::endl;
        return 1;
    }

    simulator.run(4);
    std::cout << "\n2. tick " << simulator.current_tick() << " 后的ReplicaSet:" << std::endl;
    print_replica_sets(simulator);

    // 更新镜像，观察滚动更新
    std::cout << "\n3. 更新镜像到 nginx:2.0..." << std::endl;
    auto updated = simulator.set_image("web", "nginx:2.0");
    if (!updated.ok()) {
        std::cerr << "✗ " << updated.message << std::endl;
        return 1;
    }
    for (int i = 0; i < 8; ++i) {
        simulator.tick();
        auto deployment = simulator.get<Deployment>("web");
        std::cout << "  tick " << simulator.current_tick() << ": total " << deployment->status.replicas
                  << ", updated " << deployment->status.updated_replicas
                  << ", ready " << deployment->status.ready_replicas << std::endl;
    }
    print_replica_sets(simulator);

    // 排空节点
    std::cout << "\n4. 排空 node-1..." << std::endl;
    auto drained = simulator.drain_node("node-1");
    if (drained.data) {
        std::cout << "  驱逐: " << drained.data->evicted.size()
                  << ", 阻止: " << drained.data->blocked.size() << std::endl;
    }
    simulator.run(4);

    std::cout << "\n5. Service web 的端点:" << std::endl;
    for (const auto& endpoint : simulator.service_endpoints("web")) {
        std::cout << "  - " << endpoint << std::endl;
    }

    std::cout << "\n6. 最近的事件:" << std::endl;
    const auto& events = simulator.events();
    size_t start = events.size() > 10 ? events.size() - 10 : 0;
    for (size_t i = start; i < events.size(); ++i) {
        const auto& event = events[i];
        std::cout << "  [" << event.tick << "] " << event_type_to_string(event.type) << " " << event.reason
                  << " " << kind_to_string(event.object_kind) << "/" << event.object_name << ": "
                  << event.message << std::endl;
    }

    std::cout << "\n=== 示例完成 ===" << std::endl;
    return 0;
}
