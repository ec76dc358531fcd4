#include <gtest/gtest.h>
#include "../include/api/labels.h"

using namespace kubesim;

class LabelsTest : public ::testing::Test {
protected:
    PodTemplate make_template(const std::string& image) {
        PodTemplate tmpl;
        tmpl.labels = {{"app", "web"}, {"tier", "frontend"}};
        tmpl.spec.image = image;
        return tmpl;
    }
};

TEST_F(LabelsTest, SelectorMatchesSubset) {
    Labels labels = {{"app", "web"}, {"tier", "frontend"}};

    EXPECT_TRUE(selector_matches({{"app", "web"}}, labels));
    EXPECT_TRUE(selector_matches({{"app", "web"}, {"tier", "frontend"}}, labels));
    EXPECT_FALSE(selector_matches({{"app", "db"}}, labels));
    EXPECT_FALSE(selector_matches({{"app", "web"}, {"env", "prod"}}, labels));
}

TEST_F(LabelsTest, EmptySelectorMatchesNothing) {
    EXPECT_FALSE(selector_matches({}, {{"app", "web"}}));
    EXPECT_FALSE(selector_matches({}, {}));
}

TEST_F(LabelsTest, TolerationOperators) {
    Taint taint("dedicated", "gpu", TaintEffect::NoSchedule);

    EXPECT_TRUE(toleration_matches(Toleration("dedicated", TolerationOperator::Exists), taint));
    EXPECT_TRUE(toleration_matches(Toleration("dedicated", TolerationOperator::Equal, "gpu"), taint));
    EXPECT_FALSE(toleration_matches(Toleration("dedicated", TolerationOperator::Equal, "cpu"), taint));
    EXPECT_FALSE(toleration_matches(Toleration("other", TolerationOperator::Exists), taint));
    // 空键的Exists容忍一切
    EXPECT_TRUE(toleration_matches(Toleration("", TolerationOperator::Exists), taint));
}

TEST_F(LabelsTest, TolerationEffect) {
    Taint taint("dedicated", "gpu", TaintEffect::NoExecute);

    EXPECT_FALSE(toleration_matches(
        Toleration("dedicated", TolerationOperator::Exists, "", TaintEffect::NoSchedule), taint));
    EXPECT_TRUE(toleration_matches(
        Toleration("dedicated", TolerationOperator::Exists, "", TaintEffect::NoExecute), taint));
}

TEST_F(LabelsTest, TaintsToleratedByEffect) {
    std::vector<Taint> taints = {
        Taint("soft", "", TaintEffect::PreferNoSchedule),
        Taint("hard", "", TaintEffect::NoSchedule)
    };

    EXPECT_TRUE(taints_tolerated(taints, {}, {TaintEffect::NoExecute}));
    EXPECT_FALSE(taints_tolerated(taints, {}, {TaintEffect::NoSchedule, TaintEffect::NoExecute}));
    EXPECT_TRUE(taints_tolerated(taints, {Toleration("hard", TolerationOperator::Exists)},
                                 {TaintEffect::NoSchedule, TaintEffect::NoExecute}));
    EXPECT_FALSE(taints_tolerated(taints, {}, {TaintEffect::PreferNoSchedule}));
}

TEST_F(LabelsTest, TemplateHashIsStable) {
    std::string a = compute_template_hash(make_template("nginx:1.0"));
    std::string b = compute_template_hash(make_template("nginx:1.0"));
    std::string c = compute_template_hash(make_template("nginx:2.0"));

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a.size(), 10u);
    for (char ch : a) {
        EXPECT_TRUE((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z'));
    }
}

TEST_F(LabelsTest, TemplateHashIgnoresInsertionOrderAndHashLabel) {
    PodTemplate first;
    first.labels["tier"] = "frontend";
    first.labels["app"] = "web";
    first.spec.image = "nginx:1.0";

    PodTemplate second;
    second.labels["app"] = "web";
    second.labels["tier"] = "frontend";
    second.labels[LabelKeys::POD_TEMPLATE_HASH] = "abcdef";
    second.spec.image = "nginx:1.0";

    EXPECT_EQ(compute_template_hash(first), compute_template_hash(second));
}
