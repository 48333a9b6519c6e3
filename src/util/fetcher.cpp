#include <crabby/fetcher.hpp>
#include <crabby/log.hpp>

#include <algorithm>
#include <chrono>
#include <thread>

namespace crabby {

Fetcher::Fetcher(Registry& registry, PackageCache& cache, FetchOptions options)
    : registry_(registry), cache_(cache), options_(options),
      pool_(static_cast<size_t>(std::max(1, options.jobs))) {}

Fetcher::~Fetcher() = default;

int Fetcher::backoff_ms(const FetchOptions& options, int attempt) {
    long long delay = options.retry_delay_ms;
    for (int i = 1; i < attempt && delay < options.retry_max_delay_ms; ++i) {
        delay *= 2;
    }
    return static_cast<int>(std::min<long long>(delay, options.retry_max_delay_ms));
}

bool Fetcher::sleep_unless_cancelled(int ms) const {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cancelled()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(ms, 10)));
    }
    return !cancelled();
}

FetchFuture Fetcher::request(const CacheKey& key, const std::string& tarball_url) {
    std::string id = key.to_string() + "#" + key.integrity;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inflight_.find(id);
    if (it != inflight_.end()) return it->second;

    FetchFuture future = pool_.submit([this, key, tarball_url]() {
        return fetch_one(key, tarball_url);
    }).share();
    inflight_.emplace(id, future);
    return future;
}

Result<FetchedPackage> Fetcher::fetch_one(const CacheKey& key, const std::string& url) {
    if (cancelled()) {
        return CrabbyError{CrabbyError::Cancelled, "fetch of " + key.to_string() + " cancelled"};
    }

    FetchedPackage fetched;
    if (auto hit = cache_.find(key)) {
        log::debug("cache hit %s", key.to_string().c_str());
        fetched.entry = std::move(*hit);
        fetched.cache_hit = true;
        return Result<FetchedPackage>::ok(std::move(fetched));
    }

    const int attempts = std::max(1, options_.retries);
    CrabbyError last;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        fetched.attempts = attempt;
        log::debug("fetching %s (attempt %d/%d)", key.to_string().c_str(), attempt, attempts);

        auto bytes = registry_.fetch_tarball(url);
        if (bytes.is_ok()) {
            auto stored = cache_.store(key, bytes.value());
            if (stored.is_ok()) {
                fetched.entry = std::move(stored).value();
                return Result<FetchedPackage>::ok(std::move(fetched));
            }
            last = std::move(stored).error();
        } else {
            last = std::move(bytes).error();
        }

        bool retryable = last.is_transient() || last.code == CrabbyError::IntegrityMismatch;
        if (!retryable || attempt == attempts) break;

        int delay = backoff_ms(options_, attempt);
        log::warn("%s: %s, retrying in %d ms (attempt %d/%d)", key.to_string().c_str(),
                  last.message.c_str(), delay, attempt + 1, attempts);
        if (!sleep_unless_cancelled(delay)) {
            return CrabbyError{CrabbyError::Cancelled, "fetch of " + key.to_string() + " cancelled"};
        }
    }

    if (last.is_transient()) {
        return CrabbyError{CrabbyError::Network,
            "failed to fetch " + key.to_string() + " after " +
                std::to_string(fetched.attempts) + " attempts: " + last.message,
            "check the registry URL and your network connection"};
    }
    if (last.code == CrabbyError::IntegrityMismatch && last.hint.empty()) {
        last.hint = "the registry served different content than the lockfile records";
    }
    return last;
}

} // namespace crabby
