#include "llm/PrewarmCache.hpp"

namespace llm {

PrewarmCache::PrewarmCache(VignettePersonalizer& personalizer) : m_personalizer(personalizer) {}

PrewarmCache::~PrewarmCache() {
    std::lock_guard<std::mutex> lock(m_mu);
    for (auto& kv : m_entries) {
        if (kv.second.valid()) kv.second.wait();
    }
}

void PrewarmCache::prewarm(const elicit::Vignette& vignette, const elicit::UserContext& user_context) {
    std::lock_guard<std::mutex> lock(m_mu);
    if (m_entries.count(vignette.vignette_id)) return;

    VignettePersonalizer* p = &m_personalizer;
    m_entries.emplace(vignette.vignette_id,
                      std::async(std::launch::async, [p, vignette, user_context]() {
                          return p->personalize(vignette, user_context);
                      }).share());
}

elicit::Vignette PrewarmCache::take(const elicit::Vignette& vignette, const elicit::UserContext& user_context) {
    std::shared_future<elicit::Vignette> entry;
    std::promise<elicit::Vignette> pending;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(m_mu);
        auto it = m_entries.find(vignette.vignette_id);
        if (it == m_entries.end()) {
            it = m_entries.emplace(vignette.vignette_id, pending.get_future().share()).first;
            owner = true;
        }
        entry = it->second;
    }

    // personalise without the lock; concurrent takes of this id wait on the placeholder
    if (owner) {
        try {
            pending.set_value(m_personalizer.personalize(vignette, user_context));
        } catch (const std::exception&) {
            pending.set_exception(std::current_exception());
        }
    }

    return entry.get();
}

bool PrewarmCache::contains(const std::string& vignette_id) const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_entries.count(vignette_id) > 0;
}

size_t PrewarmCache::size() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_entries.size();
}

} // namespace llm
