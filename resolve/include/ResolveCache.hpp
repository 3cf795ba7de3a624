#pragma once
#include <Resolve.hpp>
#include <Log.hpp>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace esmc
{
    // Memoizes another resolver. Entries are keyed by the structural identity of the arguments, so two references
    // with equal fields share one answer. Call invalidate() when the underlying resolver's answers change.
    class ResolveCache : public Resolver
    {
    public:
        struct Key
        {
            ResolveOrigin origin;
            Request request;
            ReferenceSubType subType;
            bool operator==(const Key &other) const = default;
        };

        struct KeyHash
        {
            size_t operator()(const Key &key) const
            {
                auto seed = std::hash<ResolveOrigin>()(key.origin);
                seed = hashCombine(seed, std::hash<Request>()(key.request));
                return hashCombine(seed, std::hash<ReferenceSubType>()(key.subType));
            }
        };

        struct Stats
        {
            size_t hits{};
            size_t misses{};
        };

        // Neither the inner resolver nor the logger are owned, both have to outlive the cache
        ResolveCache(const Resolver &inner_, Logger &log_) : inner(inner_), log(log_) {}

        ResolveResult resolve(const ResolveOrigin &origin, const Request &request, const ReferenceSubType &subType) const override;

        void invalidate();
        Stats stats() const;
        size_t size() const;

    private:
        const Resolver &inner;
        Logger &log;
        mutable std::mutex mutex;
        mutable std::unordered_map<Key, ResolveResult, KeyHash> entries;
        mutable Stats counters;
        // Bumped by invalidate()
        uint64_t generation = 0;
    };
}
