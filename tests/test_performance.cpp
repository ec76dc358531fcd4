#include <gtest/gtest.h>
#include <chrono>
#include <iostream>
#include "../include/engine/simulator.h"

using namespace kubesim;

class PerformanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        SimulatorConfig config;
        config.log_level = "warn";
        config.node_pool.count = 50;
        config.node_pool.capacity_pods = 40;
        // 大规模场景下只保留最近的事件
        config.event_log_capacity = 10000;
        sim = std::make_unique<Simulator>(config);
    }

    std::unique_ptr<Simulator> sim;
};

// 基准测试：直接创建Pod
TEST_F(PerformanceTest, PodCreationBenchmark) {
    const int NUM_PODS = 1000;

    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < NUM_PODS; ++i) {
        Pod pod("benchmark-pod-" + std::to_string(i));
        pod.metadata.labels = {{"app", "benchmark"}};
        pod.spec.image = "nginx:latest";
        ASSERT_TRUE(sim->create(pod).ok());
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    std::cout << "Created " << NUM_PODS << " pods in " << duration.count() << "ms" << std::endl;
    std::cout << "Average: " << (double)duration.count() / NUM_PODS << "ms per pod" << std::endl;

    EXPECT_LT(duration.count() / NUM_PODS, 5);

    // 调度与启动
    start_time = std::chrono::high_resolution_clock::now();
    sim->run(2);
    end_time = std::chrono::high_resolution_clock::now();
    duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    std::cout << "Scheduled and started " << NUM_PODS << " pods in " << duration.count() << "ms" << std::endl;

    int running = 0;
    for (const auto& pod : sim->list<Pod>()) {
        if (pod.status.phase == PodPhase::Running) ++running;
    }
    EXPECT_EQ(running, NUM_PODS);
    EXPECT_NO_THROW(sim->check_invariants());
}

// 基准测试：多个Deployment同时滚动更新
TEST_F(PerformanceTest, RollingUpdateBenchmark) {
    const int NUM_DEPLOYMENTS = 20;
    const int REPLICAS = 50;

    for (int i = 0; i < NUM_DEPLOYMENTS; ++i) {
        std::string name = "app-" + std::to_string(i);
        Deployment deployment(name);
        deployment.spec.replicas = REPLICAS;
        deployment.spec.strategy.max_surge = 10;
        deployment.spec.strategy.max_unavailable = 10;
        deployment.spec.selector = {{"app", name}};
        deployment.spec.template_.labels = {{"app", name}};
        deployment.spec.template_.spec.image = "nginx:1.0";
        ASSERT_TRUE(sim->create(deployment).ok());
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    sim->run(5);
    for (int i = 0; i < NUM_DEPLOYMENTS; ++i) {
        ASSERT_TRUE(sim->set_image("app-" + std::to_string(i), "nginx:2.0").ok());
    }

    const int NUM_TICKS = 40;
    for (int i = 0; i < NUM_TICKS; ++i) {
        sim->tick();
        ASSERT_NO_THROW(sim->check_invariants());
    }
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    std::cout << "Ran " << NUM_TICKS + 5 << " ticks over " << NUM_DEPLOYMENTS * REPLICAS << " pods in "
              << duration.count() << "ms" << std::endl;
    std::cout << "Average: " << (double)duration.count() / (NUM_TICKS + 5) << "ms per tick" << std::endl;

    int updated = 0;
    for (const auto& pod : sim->list<Pod>()) {
        if (pod.is_healthy() && pod.spec.image == "nginx:2.0") ++updated;
    }
    EXPECT_EQ(updated, NUM_DEPLOYMENTS * REPLICAS);

    EXPECT_LT(duration.count() / (NUM_TICKS + 5), 200);
}

// 基准测试：列表与快照
TEST_F(PerformanceTest, SnapshotBenchmark) {
    ReplicaSet rs("web");
    rs.spec.replicas = 1000;
    rs.spec.selector = {{"app", "web"}};
    rs.spec.template_.labels = {{"app", "web"}};
    rs.spec.template_.spec.image = "nginx:latest";
    ASSERT_TRUE(sim->create(rs).ok());
    sim->run(3);

    const int NUM_REQUESTS = 100;
    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < NUM_REQUESTS; ++i) {
        auto pods = sim->list<Pod>();
        EXPECT_EQ(pods.size(), 1000u);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    std::cout << "Listed 1000 pods " << NUM_REQUESTS << " times in " << duration.count() << "ms" << std::endl;

    start_time = std::chrono::high_resolution_clock::now();
    nlohmann::json snapshot = sim->snapshot();
    end_time = std::chrono::high_resolution_clock::now();
    duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    std::cout << "Snapshot of " << snapshot["pods"].size() << " pods in " << duration.count() << "ms" << std::endl;

    EXPECT_EQ(snapshot["pods"].size(), 1000u);
}
