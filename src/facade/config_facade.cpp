/**
 * @file config_facade.cpp
 * @brief ConfigFacade implementation.
 * @author Dimitris Kafetzis
 */

#include "facade/config_facade.hpp"

#include "grant/grant_protocol.hpp"

#include <chrono>
#include <exception>

namespace beaconfig {

namespace {

constexpr auto WAITER_POLL = std::chrono::milliseconds(100);

std::string display_key(const std::string& group_key) {
    return group_key.empty() ? std::string{"<all>"} : group_key;
}

}  // anonymous namespace

ConfigFacade::ConfigFacade(IDiscovery& discovery,
                           IDemander& demander,
                           IClaimer& claimer,
                           ClaimRequest request,
                           Logger& logger)
    : discovery_(discovery)
    , demander_(demander)
    , claimer_(claimer)
    , request_(std::move(request))
    , logger_(logger) {}

// ─────────────────────────────────────────────
// Resolve
// ─────────────────────────────────────────────

Result<ConfigMapping> ConfigFacade::resolve(const std::string& group_key,
                                            bool bypass_cache,
                                            std::stop_token stop) {
    std::promise<Result<ConfigMapping>> promise;
    SharedResult shared;

    {
        std::lock_guard lock(mutex_);
        if (!bypass_cache) {
            if (auto cached = cache_.find(group_key); cached != cache_.end()) {
                logger_.debug("facade", "Cache hit for " + display_key(group_key));
                return cached->second;
            }
        }
        if (auto running = in_flight_.find(group_key); running != in_flight_.end()) {
            shared = running->second;
        } else {
            in_flight_.emplace(group_key, promise.get_future().share());
        }
    }

    if (shared.valid()) {
        logger_.debug("facade", "Joining in-flight cycle for " + display_key(group_key));
        return await_shared(shared, group_key, stop);
    }

    // Leader: run the cycle, publish to cache and waiters.
    try {
        auto result = run_cycle(group_key, stop);
        {
            std::lock_guard lock(mutex_);
            if (result) cache_.insert_or_assign(group_key, *result);
            in_flight_.erase(group_key);
        }
        promise.set_value(result);
        return result;
    } catch (...) {
        {
            std::lock_guard lock(mutex_);
            in_flight_.erase(group_key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

Result<ConfigMapping> ConfigFacade::await_shared(const SharedResult& shared,
                                                 const std::string& group_key,
                                                 std::stop_token stop) {
    while (shared.wait_for(WAITER_POLL) != std::future_status::ready) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::Cancelled,
                         "Resolve of " + display_key(group_key) + " cancelled while waiting"};
        }
    }
    return shared.get();
}

Result<ConfigMapping> ConfigFacade::run_cycle(const std::string& group_key,
                                              std::stop_token stop) {
    auto cycle = ++cycles_;
    logger_.info("facade", "Starting cycle " + std::to_string(cycle) + " for "
                 + display_key(group_key) + " via " + std::string{discovery_.name()}
                 + " discovery");

    auto endpoint = discovery_.discover(request_, stop);
    if (!endpoint) {
        logger_.error("facade", "Discovery failed: " + endpoint.error().describe());
        return endpoint.error();
    }

    GrantProtocol grant(demander_, claimer_, logger_);
    auto mapping = grant.run(*endpoint, request_, stop);
    if (!mapping) {
        logger_.error("facade", "Grant failed: " + mapping.error().describe());
        return mapping.error();
    }

    return select_group(*mapping, group_key);
}

// ─────────────────────────────────────────────
// Cache
// ─────────────────────────────────────────────

bool ConfigFacade::has_cached(const std::string& group_key) const {
    std::lock_guard lock(mutex_);
    return cache_.contains(group_key);
}

void ConfigFacade::invalidate(const std::string& group_key) {
    std::lock_guard lock(mutex_);
    cache_.erase(group_key);
}

void ConfigFacade::invalidate_all() {
    std::lock_guard lock(mutex_);
    cache_.clear();
}

// ─────────────────────────────────────────────
// Group Selection
// ─────────────────────────────────────────────

Result<ConfigMapping> ConfigFacade::select_group(const ConfigMapping& mapping,
                                                 const std::string& group_key) {
    if (group_key.empty()) return mapping;

    auto dot = group_key.find('.');
    auto head = group_key.substr(0, dot);

    auto it = mapping.find(head);
    if (it == mapping.end()) {
        return Error{ErrorCode::MissingGroup, "No group '" + head + "' in claimed configuration"};
    }

    const nlohmann::json* node = &it->second;
    std::string path = head;
    while (dot != std::string::npos) {
        auto start = dot + 1;
        dot = group_key.find('.', start);
        auto segment = group_key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        path += "." + segment;

        if (!node->is_object() || !node->contains(segment)) {
            return Error{ErrorCode::MissingGroup, "No group '" + path + "' in claimed configuration"};
        }
        node = &node->at(segment);
    }

    if (!node->is_object()) {
        return Error{ErrorCode::MissingGroup, "'" + path + "' is a value, not a group"};
    }

    ConfigMapping group;
    for (const auto& [key, value] : node->items()) {
        group.emplace(key, value);
    }
    return group;
}

}  // namespace beaconfig
