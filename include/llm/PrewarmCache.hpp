#pragma once

#include "llm/VignettePersonalizer.hpp"

#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace llm {

// Personalised vignettes keyed by vignette id. prewarm() starts the rewrite in
// the background; take() hands back the same result however often it is called.
// The personalizer must outlive the cache and tolerate concurrent calls.
class PrewarmCache {
public:
    explicit PrewarmCache(VignettePersonalizer& personalizer);
    ~PrewarmCache();

    PrewarmCache(const PrewarmCache&) = delete;
    PrewarmCache& operator=(const PrewarmCache&) = delete;

    // No-op when the id is already cached or in flight.
    void prewarm(const elicit::Vignette& vignette, const elicit::UserContext& user_context);

    // Waits for a running prewarm, otherwise personalises synchronously on the
    // calling thread without holding the cache lock. A failed rewrite is rethrown here.
    elicit::Vignette take(const elicit::Vignette& vignette, const elicit::UserContext& user_context);

    bool contains(const std::string& vignette_id) const;
    size_t size() const;

private:
    VignettePersonalizer& m_personalizer;

    mutable std::mutex m_mu;
    std::unordered_map<std::string, std::shared_future<elicit::Vignette>> m_entries;
};

} // namespace llm
