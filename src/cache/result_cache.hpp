#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../helpers/debug.hpp"
#include "../helpers/string_helper.hpp"
#include "../models/mail/types.hpp"

namespace mailbridge::cache {
    struct cache_stats {
        std::size_t hits{0};
        std::size_t misses{0};
        std::size_t expired{0};
        std::size_t evictions{0};
    };

    /**
     * Search results memoized for the lifetime of the process.
     *
     * Entries are served while younger than the TTL; stale entries are only
     * dropped when looked up. When full, the least recently used entry makes
     * room for the new one. Safe to share between concurrent tool calls.
     *
     * New mail does not invalidate anything: a cached search can be up to one
     * TTL behind the mailbox.
     */
    class result_cache {
    public:
        using clock_fn = std::function<std::chrono::steady_clock::time_point()>;

        explicit result_cache(std::size_t capacity = 100,
                              std::chrono::milliseconds ttl = std::chrono::hours{1},
                              clock_fn now = [] { return std::chrono::steady_clock::now(); })
            : capacity_{std::max<std::size_t>(capacity, 1)}, ttl_{ttl}, now_{std::move(now)} {}

        // Phrase case and mailbox order do not matter
        static std::string make_key(std::string_view phrase, std::span<const mail::mailbox_kind> mailboxes,
                                    mail::search_scope scope) {
            std::vector<std::string_view> names;
            for (auto kind : mailboxes) {
                names.push_back(mail::to_string(kind));
            }
            std::sort(names.begin(), names.end());
            names.erase(std::unique(names.begin(), names.end()), names.end());

            std::string joined;
            for (auto name : names) {
                if (!joined.empty()) joined += ',';
                joined += name;
            }
            return std::format("{}|{}|{}", helpers::StringHelper::to_lower(helpers::StringHelper::trim(phrase)),
                               joined, mail::to_string(scope));
        }

        std::optional<mail::search_result> get(const std::string& key) {
            std::lock_guard lock(mutex_);
            auto found = index_.find(key);
            if (found == index_.end()) {
                ++stats_.misses;
                return std::nullopt;
            }

            auto entry = found->second;
            if (now_() - entry->created >= ttl_) {
                CACHE_DEBUG_FMT("Entry expired: {}", key);
                entries_.erase(entry);
                index_.erase(found);
                ++stats_.expired;
                ++stats_.misses;
                return std::nullopt;
            }

            entries_.splice(entries_.begin(), entries_, entry);
            ++stats_.hits;
            CACHE_TRACE_FMT("Hit: {}", key);
            return entry->value;
        }

        void put(const std::string& key, mail::search_result value) {
            std::lock_guard lock(mutex_);
            if (auto found = index_.find(key); found != index_.end()) {
                found->second->value = std::move(value);
                found->second->created = now_();
                entries_.splice(entries_.begin(), entries_, found->second);
                return;
            }

            if (entries_.size() >= capacity_) {
                auto& victim = entries_.back();
                CACHE_DEBUG_FMT("Evicting least recently used entry: {}", victim.key);
                index_.erase(victim.key);
                entries_.pop_back();
                ++stats_.evictions;
            }

            entries_.push_front({key, std::move(value), now_()});
            index_[key] = entries_.begin();
        }

        std::size_t size() const {
            std::lock_guard lock(mutex_);
            return entries_.size();
        }

        void clear() {
            std::lock_guard lock(mutex_);
            entries_.clear();
            index_.clear();
        }

        cache_stats stats() const {
            std::lock_guard lock(mutex_);
            return stats_;
        }

        std::size_t capacity() const { return capacity_; }
        std::chrono::milliseconds ttl() const { return ttl_; }

    private:
        struct entry {
            std::string key;
            mail::search_result value;
            std::chrono::steady_clock::time_point created;
        };

        std::size_t capacity_;
        std::chrono::milliseconds ttl_;
        clock_fn now_;
        std::list<entry> entries_;      // most recently used first
        std::unordered_map<std::string, std::list<entry>::iterator> index_;
        cache_stats stats_;
        mutable std::mutex mutex_;
    };
}
