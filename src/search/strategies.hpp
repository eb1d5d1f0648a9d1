#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <expected>
#include <format>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../helpers/debug.hpp"
#include "../helpers/string_helper.hpp"
#include "../models/mail/store.hpp"
#include "../models/mail/types.hpp"

namespace mailbridge::search {
    struct search_options {
        std::chrono::milliseconds index_timeout{std::chrono::seconds{30}};
        std::chrono::milliseconds subject_timeout{std::chrono::minutes{2}};
        std::size_t max_scan_items{500};
        std::size_t max_search_body_chars{0};
        std::size_t batch_size{50};
    };

    /**
     * Records claimed across every mailbox and folder of one request.
     * Concurrent mailbox searches share one budget so the request stops
     * searching as soon as the global cap is met.
     */
    class budget {
    public:
        explicit budget(std::size_t cap) : cap_{cap} {}

        std::size_t cap() const { return cap_; }

        std::size_t remaining() const {
            auto used = used_.load();
            return used >= cap_ ? 0 : cap_ - used;
        }

        bool exhausted() const { return remaining() == 0; }

        void consume(std::size_t count) { used_ += count; }

    private:
        std::size_t cap_;
        std::atomic<std::size_t> used_{0};
    };

    struct strategy_failure {
        std::string reason;
        bool timed_out{false};
    };

    struct strategy_hit {
        std::vector<mail::email_record> records;
        bool truncated{false};     // more matches existed than the limit allowed
    };

    using strategy_outcome = std::expected<strategy_hit, strategy_failure>;

    // Everything a strategy needs to search one folder
    struct strategy_context {
        mail::store_session& session;
        const mail::mailbox_handle& mailbox;
        const std::string& folder;
        const std::string& phrase;
        std::size_t limit;
        const search_options& options;
    };

    struct strategy {
        mail::strategy_kind kind;
        std::string_view name;
        std::function<strategy_outcome(strategy_context&)> run;
    };

    namespace detail {
        // Keeps the newest matches (highest UIDs) up to the limit
        inline strategy_outcome fetch_newest(strategy_context& ctx, std::vector<long long> uids) {
            std::sort(uids.begin(), uids.end(), std::greater<>());
            uids.erase(std::unique(uids.begin(), uids.end()), uids.end());
            bool truncated = uids.size() > ctx.limit;
            if (truncated) {
                uids.resize(ctx.limit);
            }
            if (uids.empty()) {
                return strategy_hit{};
            }
            return strategy_hit{ctx.session.fetch(ctx.mailbox, ctx.folder, uids), truncated};
        }

        inline strategy_outcome server_search(strategy_context& ctx, mail::query_field field, std::chrono::milliseconds timeout) {
            auto found = ctx.session.search(ctx.folder, ctx.phrase, field, timeout);
            if (!found) {
                bool timed_out = found.error().starts_with("timed out");
                return std::unexpected(strategy_failure{found.error(), timed_out});
            }
            SEARCH_DEBUG_FMT("{} matches in {}", found->size(), ctx.folder);
            return fetch_newest(ctx, std::move(*found));
        }
    }

    // Combined subject + body query answered by the server's search index
    inline strategy_outcome index_search(strategy_context& ctx) {
        return detail::server_search(ctx, mail::query_field::subject_or_body, ctx.options.index_timeout);
    }

    // Subject-only query, cheaper and available without a body index
    inline strategy_outcome subject_search(strategy_context& ctx) {
        return detail::server_search(ctx, mail::query_field::subject, ctx.options.subject_timeout);
    }

    /**
     * Walks the folder newest first and matches the phrase in the subject
     * (and in the first max_search_body_chars of the body when configured).
     * Never looks at more than max_scan_items messages.
     */
    inline strategy_outcome manual_scan(strategy_context& ctx) {
        auto uids = ctx.session.list_uids(ctx.folder);
        std::sort(uids.begin(), uids.end(), std::greater<>());
        if (uids.size() > ctx.options.max_scan_items) {
            uids.resize(ctx.options.max_scan_items);
        }

        std::vector<long long> matches;
        bool truncated = false;
        auto batch_size = std::max<std::size_t>(ctx.options.batch_size, 1);

        for (std::size_t offset = 0; offset < uids.size() && !truncated; offset += batch_size) {
            auto count = std::min(batch_size, uids.size() - offset);
            auto summaries = ctx.session.summaries(ctx.folder,
                std::span<const long long>{uids.data() + offset, count}, ctx.options.max_search_body_chars);

            for (auto const& summary : summaries) {
                bool hit = helpers::StringHelper::contains_case_insensitive(summary.subject, ctx.phrase) ||
                    (ctx.options.max_search_body_chars > 0 &&
                     helpers::StringHelper::contains_case_insensitive(summary.body_prefix, ctx.phrase));
                if (!hit) {
                    continue;
                }
                if (matches.size() == ctx.limit) {
                    truncated = true;
                    break;
                }
                matches.push_back(summary.uid);
            }
        }

        SEARCH_DEBUG_FMT("Manual scan of {} items in {} matched {}", uids.size(), ctx.folder, matches.size());
        auto outcome = detail::fetch_newest(ctx, std::move(matches));
        if (outcome && truncated) {
            outcome->truncated = true;
        }
        return outcome;
    }

    // Strategies in the order they are tried
    inline std::vector<strategy> default_cascade() {
        return {
            {mail::strategy_kind::index, "index", index_search},
            {mail::strategy_kind::subject, "subject", subject_search},
            {mail::strategy_kind::manual, "manual", manual_scan},
        };
    }
}
