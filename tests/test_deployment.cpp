#include <gtest/gtest.h>
#include "../include/engine/simulator.h"
#include "../include/api/labels.h"

using namespace kubesim;

class DeploymentTest : public ::testing::Test {
protected:
    void SetUp() override {
        SimulatorConfig config;
        config.log_level = "warn";
        config.node_pool.count = 3;
        sim = std::make_unique<Simulator>(config);
    }

    Deployment make_deployment(const std::string& name, int32_t replicas, const std::string& image) {
        Deployment deployment(name);
        deployment.spec.replicas = replicas;
        deployment.spec.selector = {{"app", name}};
        deployment.spec.template_.labels = {{"app", name}};
        deployment.spec.template_.spec.image = image;
        return deployment;
    }

    std::string hash_for(const Deployment& deployment) {
        return compute_template_hash(deployment.spec.template_);
    }

    int count_active(const std::string& app, const std::string& image = "") {
        int count = 0;
        for (const auto& pod : sim->list<Pod>()) {
            auto label = pod.metadata.labels.find("app");
            if (label == pod.metadata.labels.end() || label->second != app) continue;
            if (pod.metadata.is_deleting() || pod.is_terminal()) continue;
            if (!image.empty() && pod.spec.image != image) continue;
            ++count;
        }
        return count;
    }

    int count_healthy(const std::string& app) {
        int count = 0;
        for (const auto& pod : sim->list<Pod>()) {
            auto label = pod.metadata.labels.find("app");
            if (label != pod.metadata.labels.end() && label->second == app && pod.is_healthy()) {
                ++count;
            }
        }
        return count;
    }

    std::unique_ptr<Simulator> sim;
};

TEST_F(DeploymentTest, CreatesReplicaSetAndPods) {
    Deployment web = make_deployment("web", 3, "nginx:1.0");
    ASSERT_TRUE(sim->create(web).ok());

    sim->run(3);

    auto replica_sets = sim->list<ReplicaSet>();
    ASSERT_EQ(replica_sets.size(), 1u);
    EXPECT_EQ(replica_sets[0].metadata.name, "web-" + hash_for(web));
    EXPECT_EQ(replica_sets[0].spec.replicas, 3);
    EXPECT_EQ(replica_sets[0].metadata.labels.at(LabelKeys::POD_TEMPLATE_HASH), hash_for(web));
    ASSERT_TRUE(replica_sets[0].metadata.owner_reference);
    EXPECT_EQ(replica_sets[0].metadata.owner_reference->name, "web");

    auto deployment = sim->get<Deployment>("web");
    ASSERT_TRUE(deployment);
    EXPECT_EQ(deployment->status.replicas, 3);
    EXPECT_EQ(deployment->status.ready_replicas, 3);
    EXPECT_EQ(deployment->status.updated_replicas, 3);
    EXPECT_EQ(deployment->status.condition, "Available");
    EXPECT_EQ(sim->recorder().count("RolloutComplete"), 1u);

    auto created = sim->recorder().last("ScalingReplicaSet");
    ASSERT_TRUE(created);
    EXPECT_EQ(created->message, "Scaled up replica set web-" + hash_for(web) + " from 0 to 3");
}

TEST_F(DeploymentTest, RollingUpdateRespectsBounds) {
    Deployment web = make_deployment("web", 3, "nginx:1.0");
    ASSERT_TRUE(sim->create(web).ok());
    sim->run(3);
    ASSERT_EQ(count_healthy("web"), 3);

    ASSERT_TRUE(sim->set_image("web", "nginx:2.0").ok());
    for (int i = 0; i < 10; ++i) {
        sim->tick();
        // maxSurge 1, maxUnavailable 1
        EXPECT_LE(count_active("web"), 4) << "tick " << sim->current_tick();
        EXPECT_GE(count_healthy("web"), 2) << "tick " << sim->current_tick();
    }

    EXPECT_EQ(count_active("web", "nginx:2.0"), 3);
    EXPECT_EQ(count_active("web", "nginx:1.0"), 0);
    EXPECT_EQ(count_healthy("web"), 3);

    auto deployment = sim->get<Deployment>("web");
    ASSERT_TRUE(deployment);
    EXPECT_EQ(deployment->status.condition, "Available");
    EXPECT_EQ(deployment->status.updated_replicas, 3);
    EXPECT_EQ(sim->recorder().count("RolloutComplete"), 2u);

    // 保留一个历史RS
    auto replica_sets = sim->list<ReplicaSet>();
    ASSERT_EQ(replica_sets.size(), 2u);
    EXPECT_EQ(replica_sets[0].spec.replicas, 0);
    EXPECT_EQ(replica_sets[1].spec.replicas, 3);
}

TEST_F(DeploymentTest, RollingUpdateSteps) {
    ASSERT_TRUE(sim->create(make_deployment("web", 3, "nginx:1.0")).ok());
    sim->run(3);

    Deployment v2 = make_deployment("web", 3, "nginx:2.0");
    std::string old_name = sim->list<ReplicaSet>()[0].metadata.name;
    std::string new_name = "web-" + hash_for(v2);
    ASSERT_TRUE(sim->set_image("web", "nginx:2.0").ok());

    auto replicas = [this](const std::string& name) {
        auto rs = sim->get<ReplicaSet>(name);
        return rs ? rs->spec.replicas : -1;
    };

    sim->tick();
    EXPECT_EQ(replicas(new_name), 1);
    EXPECT_EQ(replicas(old_name), 2);

    sim->tick();
    EXPECT_EQ(replicas(new_name), 2);
    EXPECT_EQ(replicas(old_name), 2);

    sim->tick();
    EXPECT_EQ(replicas(new_name), 2);
    EXPECT_EQ(replicas(old_name), 1);

    sim->tick();
    EXPECT_EQ(replicas(new_name), 3);
    EXPECT_EQ(replicas(old_name), 0);
}

TEST_F(DeploymentTest, RolloutUndo) {
    Deployment v1 = make_deployment("web", 3, "nginx:1.0");
    ASSERT_TRUE(sim->create(v1).ok());
    sim->run(3);

    // 没有历史版本时无法回滚
    EXPECT_EQ(sim->rollout_undo("web").status, ApiStatus::Invalid);

    ASSERT_TRUE(sim->set_image("web", "nginx:2.0").ok());
    sim->run(10);
    ASSERT_EQ(count_active("web", "nginx:2.0"), 3);

    auto undo = sim->rollout_undo("web");
    ASSERT_TRUE(undo.ok()) << undo.message;
    ASSERT_TRUE(undo.data);
    EXPECT_EQ(undo.data->spec.template_.spec.image, "nginx:1.0");
    EXPECT_EQ(sim->recorder().count("DeploymentRollback"), 1u);

    sim->run(10);
    EXPECT_EQ(count_active("web", "nginx:1.0"), 3);
    EXPECT_EQ(count_healthy("web"), 3);

    // 复用原来的RS
    auto original = sim->get<ReplicaSet>("web-" + hash_for(v1));
    ASSERT_TRUE(original);
    EXPECT_EQ(original->spec.replicas, 3);
    EXPECT_EQ(sim->list<ReplicaSet>().size(), 2u);
}

TEST_F(DeploymentTest, UndoUnknownDeployment) {
    EXPECT_EQ(sim->rollout_undo("missing").status, ApiStatus::NotFound);
    EXPECT_EQ(sim->set_image("missing", "nginx:2.0").status, ApiStatus::NotFound);
}

TEST_F(DeploymentTest, RevisionHistoryLimit) {
    Deployment v1 = make_deployment("web", 2, "nginx:1.0");
    ASSERT_TRUE(sim->create(v1).ok());
    sim->run(3);

    ASSERT_TRUE(sim->set_image("web", "nginx:2.0").ok());
    sim->run(10);
    ASSERT_TRUE(sim->set_image("web", "nginx:3.0").ok());
    sim->run(10);

    auto replica_sets = sim->list<ReplicaSet>();
    ASSERT_EQ(replica_sets.size(), 2u);
    EXPECT_FALSE(sim->get<ReplicaSet>("web-" + hash_for(v1)));
    EXPECT_EQ(count_active("web", "nginx:3.0"), 2);
}

TEST_F(DeploymentTest, RecreateNeverMixesVersions) {
    Deployment web = make_deployment("web", 3, "nginx:1.0");
    web.spec.strategy.type = DeploymentStrategyType::Recreate;
    ASSERT_TRUE(sim->create(web).ok());
    sim->run(3);

    ASSERT_TRUE(sim->set_image("web", "nginx:2.0").ok());
    for (int i = 0; i < 8; ++i) {
        sim->tick();
        int old_pods = count_active("web", "nginx:1.0");
        int new_pods = count_active("web", "nginx:2.0");
        EXPECT_FALSE(old_pods > 0 && new_pods > 0) << "tick " << sim->current_tick();
    }

    EXPECT_EQ(count_active("web", "nginx:2.0"), 3);
    EXPECT_EQ(count_healthy("web"), 3);
}

TEST_F(DeploymentTest, ScaleDeployment) {
    ASSERT_TRUE(sim->create(make_deployment("web", 2, "nginx:1.0")).ok());
    sim->run(3);

    ASSERT_TRUE(sim->scale<Deployment>("web", 5).ok());
    sim->run(3);

    EXPECT_EQ(count_healthy("web"), 5);
    EXPECT_EQ(sim->list<ReplicaSet>()[0].spec.replicas, 5);

    ASSERT_TRUE(sim->scale<Deployment>("web", 0).ok());
    sim->run(2);
    EXPECT_EQ(count_active("web"), 0);
}

TEST_F(DeploymentTest, RolloutStalledOnBadImage) {
    ASSERT_TRUE(sim->create(make_deployment("web", 3, "nginx:1.0")).ok());
    sim->run(3);

    sim->add_failure_rule("nginx:broken", FailureMode::ImagePullError);
    ASSERT_TRUE(sim->set_image("web", "nginx:broken").ok());
    sim->run(8);

    EXPECT_EQ(sim->recorder().count("RolloutStalled"), 1u);
    EXPECT_GE(count_healthy("web"), 2);
    EXPECT_LE(count_active("web"), 4);

    auto deployment = sim->get<Deployment>("web");
    ASSERT_TRUE(deployment);
    EXPECT_EQ(deployment->status.condition, "Progressing");
    EXPECT_EQ(deployment->status.condition_reason, "RolloutStalled");

    // 回滚后恢复
    ASSERT_TRUE(sim->rollout_undo("web").ok());
    sim->run(6);
    EXPECT_EQ(count_active("web", "nginx:1.0"), 3);
    EXPECT_EQ(count_healthy("web"), 3);
}

TEST_F(DeploymentTest, DeletionCascades) {
    ASSERT_TRUE(sim->create(make_deployment("web", 3, "nginx:1.0")).ok());
    sim->run(3);

    ASSERT_TRUE(sim->remove<Deployment>("web").ok());
    sim->run(4);

    EXPECT_FALSE(sim->get<Deployment>("web"));
    EXPECT_TRUE(sim->list<ReplicaSet>().empty());
    EXPECT_TRUE(sim->list<Pod>().empty());
}

TEST_F(DeploymentTest, RejectsInvalidSpec) {
    Deployment zero_budget = make_deployment("web", 3, "nginx:1.0");
    zero_budget.spec.strategy.max_surge = 0;
    zero_budget.spec.strategy.max_unavailable = 0;
    EXPECT_EQ(sim->create(zero_budget).status, ApiStatus::Invalid);

    Deployment hash_label = make_deployment("web", 3, "nginx:1.0");
    hash_label.spec.template_.labels[LabelKeys::POD_TEMPLATE_HASH] = "abc";
    EXPECT_EQ(sim->create(hash_label).status, ApiStatus::Invalid);

    Deployment no_image = make_deployment("web", 3, "");
    EXPECT_EQ(sim->create(no_image).status, ApiStatus::Invalid);

    Deployment bad_name = make_deployment("Web_App", 3, "nginx:1.0");
    EXPECT_EQ(sim->create(bad_name).status, ApiStatus::Invalid);

    ASSERT_TRUE(sim->create(make_deployment("web", 3, "nginx:1.0")).ok());
    EXPECT_EQ(sim->create(make_deployment("web", 3, "nginx:1.0")).status, ApiStatus::AlreadyExists);
    EXPECT_EQ(sim->set_image("web", "").status, ApiStatus::Invalid);
}
