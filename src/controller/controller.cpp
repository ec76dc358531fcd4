#include "controller/controller.h"
#include <spdlog/spdlog.h>

namespace kubesim {

namespace {

// 与Kubernetes生成名后缀相同的字符集（不含元音，避免拼出单词）
constexpr char kSuffixAlphabet[] = "bcdfghjklmnpqrstvwxz2456789";
constexpr int kSuffixLength = 5;

} // namespace

std::string name_suffix(uint64_t seed) {
    // splitmix64
    uint64_t x = seed + 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    x = x ^ (x >> 31);

    const uint64_t base = sizeof(kSuffixAlphabet) - 1;
    std::string suffix(kSuffixLength, 'b');
    for (int i = 0; i < kSuffixLength; ++i) {
        suffix[i] = kSuffixAlphabet[x % base];
        x /= base;
    }
    return suffix;
}

bool is_active_pod(const Pod& pod) {
    return !pod.metadata.is_deleting() && !pod.is_terminal();
}

void mark_pod_deleting(Pod& pod, Tick tick) {
    if (pod.metadata.is_deleting()) {
        return;
    }
    pod.metadata.deletion_tick = tick;
    if (!pod.is_terminal()) {
        pod.status.phase = PodPhase::Terminating;
    }
    pod.status.ready = false;
}

void mark_deleting(ObjectMeta& meta, Tick tick) {
    if (!meta.deletion_tick) {
        meta.deletion_tick = tick;
    }
}

std::string generate_pod_name(const ClusterStore& store, const std::string& base,
                              const std::string& namespace_) {
    return generate_name<Pod>(store, base, namespace_);
}

Pod& create_pod_from_template(TickContext& ctx, const PodTemplate& tmpl, const std::string& name,
                              const std::string& namespace_, const OwnerReference& owner) {
    Pod pod(name, namespace_);
    pod.metadata.labels = tmpl.labels;
    pod.metadata.owner_reference = owner;
    pod.spec = tmpl.spec;
    pod.spec.node_name.clear();
    pod.status.start_tick = ctx.tick;

    Pod& created = ctx.store.add(std::move(pod), ctx.tick);
    spdlog::debug("[{}] created pod {}/{}", kind_to_string(owner.kind), namespace_, name);
    ctx.normal(owner.kind, owner.name, "SuccessfulCreate", "Created pod: " + name);
    return created;
}

} // namespace kubesim
