#pragma once

#include <initializer_list>
#include "api/types.h"

namespace kubesim {

// 选择器匹配：选择器的每个键都存在且值相等；空选择器不匹配任何对象
bool selector_matches(const Labels& selector, const Labels& labels);

// 单个容忍是否容忍某个污点
bool toleration_matches(const Toleration& toleration, const Taint& taint);
bool taint_tolerated(const Taint& taint, const std::vector<Toleration>& tolerations);

// effects中列出的效果的污点是否全部被容忍
bool taints_tolerated(const std::vector<Taint>& taints,
                      const std::vector<Toleration>& tolerations,
                      std::initializer_list<TaintEffect> effects);

// 模板哈希：与标签插入顺序无关，忽略pod-template-hash标签
std::string compute_template_hash(const PodTemplate& tmpl);

} // namespace kubesim
