#include <ResolveCache.hpp>

namespace esmc
{
    ResolveResult ResolveCache::resolve(const ResolveOrigin &origin, const Request &request, const ReferenceSubType &subType) const
    {
        Key key{origin, request, subType};
        uint64_t startGeneration;
        {
            std::lock_guard lock{mutex};
            if (auto it = entries.find(key); it != entries.end())
            {
                counters.hits++;
                return it->second;
            }
            startGeneration = generation;
        }
        // Resolving happens outside the lock. Two threads may race on the same key, the answers are equal anyway
        auto result = inner.resolve(origin, request, subType);
        std::lock_guard lock{mutex};
        counters.misses++;
        log.print(Logger::Debug, "resolved {} from {} ({} entries)", request.toString(), origin.path, result.primary.size());
        // Invalidated while resolving, the answer may already be stale
        if (generation != startGeneration)
            return result;
        return entries.emplace(std::move(key), std::move(result)).first->second;
    }

    void ResolveCache::invalidate()
    {
        std::lock_guard lock{mutex};
        log.print(Logger::Debug, "dropping {} cached resolve results", entries.size());
        entries.clear();
        generation++;
    }

    ResolveCache::Stats ResolveCache::stats() const
    {
        std::lock_guard lock{mutex};
        return counters;
    }

    size_t ResolveCache::size() const
    {
        std::lock_guard lock{mutex};
        return entries.size();
    }
}
