/**
 * @file config_facade.hpp
 * @brief Entry point resolving configuration groups with a per-group cache.
 * @author Dimitris Kafetzis
 *
 * A resolve cycle runs discovery, then the grant protocol, then selects the
 * requested group from the claimed mapping. Cycles are single-flight per
 * group key: concurrent resolves for the same key share one cycle and its
 * outcome. Different keys run independently.
 *
 * The facade does not own its collaborators; see ClientStack for an owning
 * assembly built from Config.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "discovery/discovery.hpp"
#include "grant/claimer.hpp"
#include "grant/demander.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>

namespace beaconfig {

class ConfigFacade {
public:
    ConfigFacade(IDiscovery& discovery,
                 IDemander& demander,
                 IClaimer& claimer,
                 ClaimRequest request,
                 Logger& logger);

    ConfigFacade(const ConfigFacade&) = delete;
    ConfigFacade& operator=(const ConfigFacade&) = delete;

    /**
     * @brief Return the configuration group at group_key.
     *
     * Served from cache unless bypass_cache is set or nothing is cached for
     * the key. A waiter joining an in-flight cycle can still leave early
     * through its own stop token; the cycle continues for the others.
     *
     * @param group_key   Dotted path into the claimed mapping; empty = all.
     * @param bypass_cache Force a fresh cycle.
     * @param stop        Cancels this caller's resolve.
     */
    Result<ConfigMapping> resolve(const std::string& group_key,
                                  bool bypass_cache = false,
                                  std::stop_token stop = {});

    [[nodiscard]] bool has_cached(const std::string& group_key) const;
    void invalidate(const std::string& group_key);
    void invalidate_all();

    /// Number of discover+grant cycles started so far.
    [[nodiscard]] uint64_t cycle_count() const noexcept { return cycles_.load(); }

    /**
     * @brief Sub-mapping at a dotted path ("a.b" selects mapping["a"]["b"]).
     *
     * MissingGroup when a segment is absent or does not name a JSON object.
     */
    static Result<ConfigMapping> select_group(const ConfigMapping& mapping,
                                              const std::string& group_key);

private:
    using SharedResult = std::shared_future<Result<ConfigMapping>>;

    Result<ConfigMapping> run_cycle(const std::string& group_key, std::stop_token stop);
    Result<ConfigMapping> await_shared(const SharedResult& shared,
                                       const std::string& group_key,
                                       std::stop_token stop);

    IDiscovery& discovery_;
    IDemander& demander_;
    IClaimer& claimer_;
    ClaimRequest request_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::map<std::string, ConfigMapping> cache_;
    std::map<std::string, SharedResult> in_flight_;
    std::atomic<uint64_t> cycles_{0};
};

}  // namespace beaconfig
