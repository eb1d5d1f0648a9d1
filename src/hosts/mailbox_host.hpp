#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <future>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../cache/result_cache.hpp"
#include "../helpers/debug.hpp"
#include "../helpers/string_helper.hpp"
#include "../helpers/worker_pool.hpp"
#include "../models/mail/connector.hpp"
#include "../models/mail/errors.hpp"
#include "../models/mail/types.hpp"
#include "../search/search_engine.hpp"
#include "../views/conversations.hpp"

namespace mailbridge::hosts {
    struct mailbox_status {
        bool accessible{false};
        std::string name;
        bool configured{true};
        std::optional<int> retention_months;
        std::string error;
    };

    struct access_report {
        bool connected{false};
        std::chrono::system_clock::time_point timestamp{};
        mailbox_status personal;
        mailbox_status shared;
        std::vector<std::string> errors;
    };

    struct host_options {
        bool shared_configured{false};
        std::string shared_name{"Shared Mailbox"};
    };

    struct chain_result {
        mail::search_result result;
        std::vector<views::conversation> conversations;
        bool cached{false};
    };

    /**
     * Front door to the mail store for the tools.
     *
     * search_chain checks the cache, searches every requested mailbox in
     * parallel on the mailbox pool (each worker with its own session), merges
     * the contributions in request order under one global cap and groups the
     * outcome into conversations.
     */
    class mailbox_host {
    public:
        mailbox_host(mail::connector& connector, cache::result_cache& cache, search::search_engine engine,
                     helpers::worker_pool& mailbox_pool, host_options options)
            : connector_{connector}, cache_{cache}, engine_{std::move(engine)}, pool_{mailbox_pool},
              options_{std::move(options)} {}

        // Throws connection_error only; a mailbox we cannot open is reported, not raised
        access_report check_access() {
            access_report report;
            auto session = connector_.connect();
            report.connected = connector_.connected();
            report.timestamp = std::chrono::system_clock::now();

            report.personal = status_of(*session, mail::mailbox_kind::personal, report.errors);

            if (options_.shared_configured) {
                report.shared = status_of(*session, mail::mailbox_kind::shared, report.errors);
            } else {
                report.shared.configured = false;
                report.shared.name = options_.shared_name;
                HOST_DEBUG("Shared mailbox not configured, not resolving it");
            }

            HOST_INFO_FMT("Access check: personal={}, shared={}", report.personal.accessible, report.shared.accessible);
            return report;
        }

        chain_result search_chain(mail::search_request request) {
            auto started = std::chrono::steady_clock::now();
            request.phrase = std::string{helpers::StringHelper::trim(request.phrase)};
            if (request.phrase.empty()) {
                throw validation_error("search_text parameter is required");
            }
            if (request.mailboxes.empty()) {
                throw validation_error("at least one of include_personal or include_shared must be true");
            }

            std::vector<mail::mailbox_kind> targets;
            for (auto kind : request.mailboxes) {
                if (kind == mail::mailbox_kind::shared && !options_.shared_configured) {
                    HOST_DEBUG("Shared mailbox not configured, skipping it");
                    continue;
                }
                if (std::find(targets.begin(), targets.end(), kind) == targets.end()) {
                    targets.push_back(kind);
                }
            }
            if (targets.empty()) {
                throw mail::mailbox_not_found_error("Shared mailbox is not configured (set shared_mailbox_email)");
            }

            auto key = cache::result_cache::make_key(request.phrase, targets, request.scope);
            if (auto cached = cache_.get(key)) {
                HOST_INFO_FMT("Cache hit for '{}'", request.phrase);
                auto conversations = views::group_conversations(cached->records);
                return {std::move(*cached), std::move(conversations), true};
            }

            connector_.connect();

            search::budget shared_budget(request.max_results);
            std::vector<std::future<mail::search_result>> pending;
            pending.reserve(targets.size());
            for (auto kind : targets) {
                pending.push_back(pool_.submit([this, kind, &request, &shared_budget] {
                    auto session = connector_.open_worker();
                    auto mailbox = session->resolve(kind);
                    if (!mailbox.accessible) {
                        throw mail::mailbox_not_found_error(std::format("{} mailbox is not accessible: {}",
                            mail::to_string(kind), mailbox.error));
                    }
                    return engine_.run(*session, mailbox, request.phrase, request.scope, shared_budget);
                }));
            }

            mail::search_result merged;
            std::unordered_set<std::string> seen;
            std::size_t failed_mailboxes = 0;
            for (std::size_t i = 0; i < pending.size(); ++i) {
                mail::search_result contribution;
                try {
                    contribution = pending[i].get();
                } catch (const std::exception& e) {
                    HOST_WARN_FMT("{} mailbox search failed: {}", mail::to_string(targets[i]), e.what());
                    merged.failures.push_back({targets[i], e.what()});
                    ++failed_mailboxes;
                    continue;
                }

                for (auto& record : contribution.records) {
                    if (merged.records.size() == request.max_results) {
                        merged.truncated = true;
                        break;
                    }
                    if (seen.insert(record.id).second) {
                        merged.records.push_back(std::move(record));
                    }
                }
                merged.truncated = merged.truncated || contribution.truncated;
                if (merged.strategy == mail::strategy_kind::none) {
                    merged.strategy = contribution.strategy;
                }
                for (auto& folder : contribution.folders) {
                    merged.folders.push_back(std::move(folder));
                }
                for (auto& failure : contribution.failures) {
                    HOST_WARN_FMT("{} folder '{}' could not be searched: {}", mail::to_string(failure.mailbox),
                                  failure.folder, failure.reason);
                    merged.failures.push_back(std::move(failure));
                }
            }

            if (failed_mailboxes == targets.size()) {
                std::string reasons;
                for (auto const& failure : merged.failures) {
                    reasons += std::format("{}{}: {}", reasons.empty() ? "" : "; ",
                                           mail::to_string(failure.mailbox), failure.reason);
                }
                throw mail::search_error(std::format("Search failed in every mailbox ({})", reasons));
            }

            merged.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            HOST_INFO_FMT("'{}': {} records from {} mailbox(es) in {} ms", request.phrase, merged.records.size(),
                          targets.size() - failed_mailboxes, merged.elapsed.count());

            // a partial answer is not pinned for the whole TTL
            if (merged.failures.empty()) {
                cache_.put(key, merged);
                HOST_DEBUG_FMT("Cached '{}' ({} entries)", request.phrase, cache_.size());
            }

            auto conversations = views::group_conversations(merged.records);
            return {std::move(merged), std::move(conversations), false};
        }

    private:
        static mailbox_status status_of(mail::store_session& session, mail::mailbox_kind kind, std::vector<std::string>& errors) {
            mailbox_status status;
            try {
                auto mailbox = session.resolve(kind);
                status.accessible = mailbox.accessible;
                status.name = mailbox.name;
                status.retention_months = mailbox.retention_months;
                status.error = mailbox.error;
            } catch (const std::exception& e) {
                status.accessible = false;
                status.error = e.what();
            }
            if (!status.accessible) {
                errors.push_back(std::format("{} mailbox: {}", mail::to_string(kind),
                                             status.error.empty() ? "not accessible" : status.error));
            }
            return status;
        }

        mail::connector& connector_;
        cache::result_cache& cache_;
        search::search_engine engine_;
        helpers::worker_pool& pool_;
        host_options options_;
    };
}
