#include <gtest/gtest.h>
#include "../include/controller/status_controller.h"

using namespace kubesim;

// 直接构造存储，绕过控制器制造不一致的状态
class InvariantTest : public ::testing::Test {
protected:
    Pod& add_bound_pod(const std::string& name, const std::string& node_name) {
        Pod pod(name);
        pod.spec.image = "nginx:1.25";
        pod.spec.node_name = node_name;
        pod.status.phase = PodPhase::Running;
        return store.add(pod, 0);
    }

    Pod& add_owned_pod(const std::string& name, const OwnerReference& owner) {
        Pod pod(name);
        pod.spec.image = "nginx:1.25";
        pod.metadata.owner_reference = owner;
        return store.add(pod, 0);
    }

    ClusterStore store;
};

TEST_F(InvariantTest, ConsistentStorePasses) {
    store.add(Node("node-1", 2), 0);
    add_bound_pod("a", "node-1");
    add_bound_pod("b", "node-1");

    // 已结束与已标记删除的Pod不占容量
    Pod& done = add_bound_pod("c", "node-1");
    done.status.phase = PodPhase::Succeeded;
    Pod& leaving = add_bound_pod("d", "node-1");
    leaving.metadata.deletion_tick = 0;

    EXPECT_NO_THROW(InvariantChecker::check(store));
}

TEST_F(InvariantTest, NodeOverCapacity) {
    store.add(Node("node-1", 1), 0);
    add_bound_pod("a", "node-1");
    add_bound_pod("b", "node-1");

    EXPECT_THROW(InvariantChecker::check(store), InvariantViolation);
}

TEST_F(InvariantTest, ActivePodOnMissingNode) {
    add_bound_pod("a", "node-gone");

    EXPECT_THROW(InvariantChecker::check(store), InvariantViolation);
}

TEST_F(InvariantTest, DanglingOwnerReference) {
    ReplicaSet& rs = store.add(ReplicaSet("web-abc"), 0);
    add_owned_pod("web-abc-1", owner_reference_for(rs));
    EXPECT_NO_THROW(InvariantChecker::check(store));

    add_owned_pod("web-old-1", OwnerReference(ResourceKind::ReplicaSet, "web-old", "uid-missing"));
    EXPECT_THROW(InvariantChecker::check(store), InvariantViolation);
}

TEST_F(InvariantTest, DanglingJobOwner) {
    Job job("nightly-1");
    job.metadata.owner_reference = OwnerReference(ResourceKind::CronJob, "nightly", "uid-missing");
    store.add(job, 0);

    EXPECT_THROW(InvariantChecker::check(store), InvariantViolation);
}

TEST_F(InvariantTest, DuplicateStatefulSetOrdinal) {
    StatefulSet& db = store.add(StatefulSet("db"), 0);
    OwnerReference owner = owner_reference_for(db);

    Pod& first = add_owned_pod("db-0", owner);
    first.spec.ordinal = 0;
    Pod& second = add_owned_pod("db-0-copy", owner);
    second.spec.ordinal = 0;

    EXPECT_THROW(InvariantChecker::check(store), InvariantViolation);

    // 旧副本处于Terminating时允许同序号的新Pod
    second.metadata.deletion_tick = 0;
    EXPECT_NO_THROW(InvariantChecker::check(store));
}

TEST_F(InvariantTest, JobActivePodsAboveParallelism) {
    Job job("batch");
    job.spec.parallelism = 1;
    job.spec.completions = 3;
    Job& stored = store.add(job, 0);

    add_owned_pod("batch-1", owner_reference_for(stored));
    EXPECT_NO_THROW(InvariantChecker::check(store));

    add_owned_pod("batch-2", owner_reference_for(stored));
    EXPECT_THROW(InvariantChecker::check(store), InvariantViolation);
}
