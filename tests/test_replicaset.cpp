#include <gtest/gtest.h>
#include <algorithm>
#include "../include/engine/simulator.h"

using namespace kubesim;

class ReplicaSetTest : public ::testing::Test {
protected:
    void SetUp() override {
        SimulatorConfig config;
        config.log_level = "warn";
        config.node_pool.count = 2;
        sim = std::make_unique<Simulator>(config);
    }

    ReplicaSet make_replica_set(const std::string& name, int32_t replicas) {
        ReplicaSet rs(name);
        rs.spec.replicas = replicas;
        rs.spec.selector = {{"app", name}};
        rs.spec.template_.labels = {{"app", name}};
        rs.spec.template_.spec.image = "nginx:1.0";
        return rs;
    }

    // 属于该RS且未删除、未结束的Pod
    std::vector<Pod> active_pods(const std::string& rs_name) {
        std::vector<Pod> result;
        for (const auto& pod : sim->list<Pod>()) {
            if (pod.metadata.owner_reference && pod.metadata.owner_reference->name == rs_name &&
                !pod.metadata.is_deleting() && !pod.is_terminal()) {
                result.push_back(pod);
            }
        }
        return result;
    }

    std::unique_ptr<Simulator> sim;
};

TEST_F(ReplicaSetTest, ConvergesToReplicas) {
    ASSERT_TRUE(sim->create(make_replica_set("web", 3)).ok());

    sim->tick();
    auto pods = active_pods("web");
    ASSERT_EQ(pods.size(), 3u);
    for (const auto& pod : pods) {
        EXPECT_EQ(pod.metadata.name.rfind("web-", 0), 0u);
        EXPECT_EQ(pod.metadata.labels.at("app"), "web");
        EXPECT_EQ(pod.status.phase, PodPhase::Pending);
    }
    EXPECT_EQ(sim->recorder().count("SuccessfulCreate"), 3u);

    sim->run(2);
    auto rs = sim->get<ReplicaSet>("web");
    ASSERT_TRUE(rs);
    EXPECT_EQ(rs->status.replicas, 3);
    EXPECT_EQ(rs->status.ready_replicas, 3);

    // 稳定后不再创建
    sim->run(5);
    EXPECT_EQ(sim->recorder().count("SuccessfulCreate"), 3u);
    EXPECT_EQ(sim->list<Pod>().size(), 3u);
}

TEST_F(ReplicaSetTest, PodNamesAreUnique) {
    ASSERT_TRUE(sim->create(make_replica_set("web", 10)).ok());
    sim->tick();

    auto pods = sim->list<Pod>();
    ASSERT_EQ(pods.size(), 10u);
    for (size_t i = 0; i < pods.size(); ++i) {
        for (size_t j = i + 1; j < pods.size(); ++j) {
            EXPECT_NE(pods[i].metadata.name, pods[j].metadata.name);
        }
    }
}

TEST_F(ReplicaSetTest, ScaleDownRemovesNotReadyFirst) {
    ASSERT_TRUE(sim->create(make_replica_set("web", 3)).ok());
    sim->run(3);

    std::vector<std::string> original;
    for (const auto& pod : active_pods("web")) {
        original.push_back(pod.metadata.name);
    }
    ASSERT_EQ(original.size(), 3u);

    ASSERT_TRUE(sim->scale<ReplicaSet>("web", 5).ok());
    sim->tick();
    ASSERT_EQ(active_pods("web").size(), 5u);

    // 新建的两个Pod尚未就绪，先被删除
    ASSERT_TRUE(sim->scale<ReplicaSet>("web", 3).ok());
    sim->tick();

    auto remaining = active_pods("web");
    ASSERT_EQ(remaining.size(), 3u);
    for (const auto& pod : remaining) {
        EXPECT_NE(std::find(original.begin(), original.end(), pod.metadata.name), original.end());
    }
    EXPECT_EQ(sim->recorder().count("SuccessfulDelete"), 2u);
}

TEST_F(ReplicaSetTest, ScaleDownRemovesNewestReadyFirst) {
    ASSERT_TRUE(sim->create(make_replica_set("web", 3)).ok());
    sim->run(3);

    auto before = active_pods("web");
    ASSERT_EQ(before.size(), 3u);

    ASSERT_TRUE(sim->scale<ReplicaSet>("web", 1).ok());
    sim->tick();

    auto remaining = active_pods("web");
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].metadata.name, before[0].metadata.name);

    // 下一个tick被回收
    sim->tick();
    EXPECT_EQ(sim->list<Pod>().size(), 1u);
}

TEST_F(ReplicaSetTest, ReplacesFailedPod) {
    ASSERT_TRUE(sim->create(make_replica_set("web", 2)).ok());
    sim->run(3);

    std::string victim = active_pods("web")[0].metadata.name;
    ASSERT_TRUE(sim->set_pod_failure(victim, FailureMode::OOMKilled).ok());
    sim->tick();

    auto pods = active_pods("web");
    ASSERT_EQ(pods.size(), 2u);
    for (const auto& pod : pods) {
        EXPECT_NE(pod.metadata.name, victim);
    }
}

TEST_F(ReplicaSetTest, ReplacesDeletedPod) {
    ASSERT_TRUE(sim->create(make_replica_set("web", 2)).ok());
    sim->run(3);

    std::string victim = active_pods("web")[1].metadata.name;
    ASSERT_TRUE(sim->remove<Pod>(victim).ok());
    sim->tick();

    EXPECT_FALSE(sim->get<Pod>(victim));
    EXPECT_EQ(active_pods("web").size(), 2u);
}

TEST_F(ReplicaSetTest, AdoptsOrphans) {
    Pod orphan("orphan");
    orphan.metadata.labels = {{"app", "web"}};
    orphan.spec.image = "nginx:1.0";
    ASSERT_TRUE(sim->create(orphan).ok());
    ASSERT_TRUE(sim->create(make_replica_set("web", 2)).ok());

    sim->tick();

    auto adopted = sim->get<Pod>("orphan");
    ASSERT_TRUE(adopted);
    ASSERT_TRUE(adopted->metadata.owner_reference);
    EXPECT_EQ(adopted->metadata.owner_reference->kind, ResourceKind::ReplicaSet);
    EXPECT_EQ(adopted->metadata.owner_reference->name, "web");
    EXPECT_EQ(active_pods("web").size(), 2u);
    EXPECT_EQ(sim->recorder().count("SuccessfulCreate"), 1u);
}

TEST_F(ReplicaSetTest, DeletionCascades) {
    ASSERT_TRUE(sim->create(make_replica_set("web", 3)).ok());
    sim->run(3);

    ASSERT_TRUE(sim->remove<ReplicaSet>("web").ok());
    auto deleting = sim->get<ReplicaSet>("web");
    ASSERT_TRUE(deleting);
    EXPECT_TRUE(deleting->metadata.is_deleting());

    sim->tick();
    EXPECT_TRUE(active_pods("web").empty());
    EXPECT_TRUE(sim->get<ReplicaSet>("web"));

    sim->tick();
    EXPECT_FALSE(sim->get<ReplicaSet>("web"));
    EXPECT_TRUE(sim->list<Pod>().empty());
}

TEST_F(ReplicaSetTest, WaitsForCapacity) {
    SimulatorConfig config;
    config.log_level = "warn";
    config.node_pool.count = 1;
    config.node_pool.capacity_pods = 2;
    Simulator small(config);

    ASSERT_TRUE(small.create(make_replica_set("web", 3)).ok());
    small.run(5);

    auto rs = small.get<ReplicaSet>("web");
    ASSERT_TRUE(rs);
    EXPECT_EQ(rs->status.replicas, 3);
    EXPECT_EQ(rs->status.ready_replicas, 2);
    EXPECT_EQ(small.recorder().count("FailedScheduling"), 1u);

    // 增加节点后收敛
    ASSERT_TRUE(small.create(Node("node-2", 2)).ok());
    small.run(2);
    rs = small.get<ReplicaSet>("web");
    ASSERT_TRUE(rs);
    EXPECT_EQ(rs->status.ready_replicas, 3);
}

TEST_F(ReplicaSetTest, RejectsInvalidSpec) {
    ReplicaSet mismatched = make_replica_set("web", 1);
    mismatched.spec.selector = {{"app", "other"}};
    EXPECT_EQ(sim->create(mismatched).status, ApiStatus::Invalid);

    ReplicaSet empty_selector = make_replica_set("web", 1);
    empty_selector.spec.selector.clear();
    EXPECT_EQ(sim->create(empty_selector).status, ApiStatus::Invalid);

    EXPECT_EQ(sim->scale<ReplicaSet>("missing", 2).status, ApiStatus::NotFound);
    ASSERT_TRUE(sim->create(make_replica_set("web", 1)).ok());
    EXPECT_EQ(sim->scale<ReplicaSet>("web", -1).status, ApiStatus::Invalid);
}
