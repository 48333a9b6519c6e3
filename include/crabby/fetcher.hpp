#pragma once

#include <crabby/cache.hpp>
#include <crabby/registry.hpp>
#include <crabby/result.hpp>
#include <crabby/worker_pool.hpp>
#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace crabby {

struct FetchOptions {
    int jobs = 16;
    int retries = 3;               // attempts in total
    int retry_delay_ms = 200;      // doubled after every failed attempt
    int retry_max_delay_ms = 2000;
};

struct FetchedPackage {
    CacheEntry entry;
    bool cache_hit = false;
    int attempts = 0;
};

using FetchFuture = std::shared_future<Result<FetchedPackage>>;

// Brings packages into the cache on a worker pool. Requests for one cache
// key share a single download. Network failures and integrity mismatches
// are retried with capped exponential backoff.
class Fetcher {
public:
    Fetcher(Registry& registry, PackageCache& cache, FetchOptions options = {});
    ~Fetcher();

    FetchFuture request(const CacheKey& key, const std::string& tarball_url);

    // Pending requests fail with Cancelled; downloads in flight finish.
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    const std::atomic<bool>& cancel_flag() const { return cancelled_; }

    // Returns the delay before attempt n+1 (n >= 1).
    static int backoff_ms(const FetchOptions& options, int attempt);

private:
    Result<FetchedPackage> fetch_one(const CacheKey& key, const std::string& url);
    bool sleep_unless_cancelled(int ms) const;

    Registry& registry_;
    PackageCache& cache_;
    FetchOptions options_;
    std::atomic<bool> cancelled_{false};

    std::mutex mutex_;
    std::map<std::string, FetchFuture> inflight_;

    // Last member: joined first on destruction while the rest is alive.
    WorkerPool pool_;
};

} // namespace crabby
