#include "api/labels.h"
#include <algorithm>

namespace kubesim {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;
constexpr int kHashLength = 10;

uint64_t fnv1a_64(const std::string& data) {
    uint64_t hash = kFnvOffsetBasis;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

} // namespace

bool selector_matches(const Labels& selector, const Labels& labels) {
    if (selector.empty()) {
        return false;
    }

    for (const auto& [key, value] : selector) {
        auto it = labels.find(key);
        if (it == labels.end() || it->second != value) {
            return false;
        }
    }
    return true;
}

bool toleration_matches(const Toleration& toleration, const Taint& taint) {
    if (toleration.effect && *toleration.effect != taint.effect) {
        return false;
    }

    if (toleration.operator_ == TolerationOperator::Exists) {
        // 空键的Exists容忍所有污点
        return toleration.key.empty() || toleration.key == taint.key;
    }

    if (toleration.key != taint.key) {
        return false;
    }
    return toleration.value == taint.value;
}

bool taint_tolerated(const Taint& taint, const std::vector<Toleration>& tolerations) {
    return std::any_of(tolerations.begin(), tolerations.end(),
                       [&taint](const Toleration& t) { return toleration_matches(t, taint); });
}

bool taints_tolerated(const std::vector<Taint>& taints,
                      const std::vector<Toleration>& tolerations,
                      std::initializer_list<TaintEffect> effects) {
    for (const auto& taint : taints) {
        bool relevant = std::find(effects.begin(), effects.end(), taint.effect) != effects.end();
        if (relevant && !taint_tolerated(taint, tolerations)) {
            return false;
        }
    }
    return true;
}

std::string compute_template_hash(const PodTemplate& tmpl) {
    PodTemplate canonical = tmpl;
    canonical.labels.erase(LabelKeys::POD_TEMPLATE_HASH);

    // nlohmann::json 的对象键有序，dump结果是规范形式
    nlohmann::json j;
    canonical.to_json(j);
    uint64_t hash = fnv1a_64(j.dump());

    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string result(kHashLength, '0');
    for (int i = kHashLength - 1; i >= 0; --i) {
        result[i] = kAlphabet[hash % 36];
        hash /= 36;
    }
    return result;
}

} // namespace kubesim
