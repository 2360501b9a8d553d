#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <utility>

namespace ledmark::network {

/**
 * One browsed service instance as the mDNS daemon reports it: the same name
 * can appear once per interface and protocol.
 */
struct ServiceInstanceKey {
    int interface = 0;
    int protocol = 0;
    std::string name;

    auto operator<=>(const ServiceInstanceKey&) const = default;
};

/**
 * ResolverSet - Owns one resolver per service instance for a browse session.
 *
 * Resolvers stay alive until their instance is removed or the set is
 * cleared, so a device that changes address or port is reported again.
 * `release` frees a resolver; it runs on whichever thread calls remove(),
 * clear() or the destructor.
 */
template<typename Resolver>
class ResolverSet {
public:
    using Release = std::function<void(Resolver*)>;

    explicit ResolverSet(Release release) : release_(std::move(release)) {}
    ~ResolverSet() { clear(); }

    ResolverSet(const ResolverSet&) = delete;
    ResolverSet& operator=(const ResolverSet&) = delete;

    [[nodiscard]] bool contains(const ServiceInstanceKey& key) const {
        return resolvers_.contains(key);
    }

    /**
     * Take ownership of `resolver`. A second resolver for an instance that
     * already has one is released immediately and false is returned.
     */
    bool add(ServiceInstanceKey key, Resolver* resolver) {
        if (!resolver) return false;
        auto [it, inserted] = resolvers_.try_emplace(std::move(key), resolver);
        if (!inserted) release_(resolver);
        return inserted;
    }

    bool remove(const ServiceInstanceKey& key) {
        auto it = resolvers_.find(key);
        if (it == resolvers_.end()) return false;
        Resolver* resolver = it->second;
        resolvers_.erase(it);
        release_(resolver);
        return true;
    }

    void clear() {
        auto resolvers = std::exchange(resolvers_, {});
        for (auto& [key, resolver] : resolvers) {
            release_(resolver);
        }
    }

    [[nodiscard]] size_t size() const { return resolvers_.size(); }

private:
    Release release_;
    std::map<ServiceInstanceKey, Resolver*> resolvers_;
};

} // namespace ledmark::network
