#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "../../helpers/debug.hpp"
#include "errors.hpp"
#include "store.hpp"

namespace mailbridge::mail {
    struct connector_options {
        int max_retries{3};
        std::chrono::milliseconds backoff_base{1000};
        std::chrono::milliseconds deadline{std::chrono::minutes{10}};
    };

    /**
     * Owns the primary session and hands out per-worker sessions.
     *
     * connect() first tries to attach to the existing primary session and only
     * opens a new one when that fails. Both paths are retried with exponential
     * backoff (base, 2*base, 4*base, ...) until max_retries attempts or the
     * deadline are used up.
     */
    class connector {
    public:
        using sleeper = std::function<void(std::chrono::milliseconds)>;

        connector(store& backend, connector_options options,
                  sleeper sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
            : store_{backend}, options_{options}, sleep_{std::move(sleep)} {}

        std::shared_ptr<store_session> connect() {
            std::lock_guard lock(mutex_);
            return with_retries("connect", [this]() -> std::shared_ptr<store_session> {
                if (primary_) {
                    if (primary_->alive()) {
                        IMAP_TRACE("Attached to existing session");
                        return primary_;
                    }
                    IMAP_WARN("Existing session is gone, opening a new one");
                    primary_.reset();
                }
                primary_ = std::shared_ptr<store_session>(store_.open());
                IMAP_INFO_FMT("Connected to {}", store_.describe());
                return primary_;
            });
        }

        // A fresh session for one worker; the caller owns it and drops it when done
        std::unique_ptr<store_session> open_worker() {
            return with_retries("open worker session", [this] { return store_.open(); });
        }

        bool connected() const {
            std::lock_guard lock(mutex_);
            return primary_ != nullptr;
        }

    private:
        template <typename F>
        auto with_retries(std::string_view what, F attempt) -> decltype(attempt()) {
            auto const started = std::chrono::steady_clock::now();
            auto const attempts = options_.max_retries > 0 ? options_.max_retries : 1;
            std::string last_error;
            std::chrono::steady_clock::duration slept{0};

            for (int i = 0; i < attempts; ++i) {
                try {
                    return attempt();
                } catch (const std::exception& e) {
                    last_error = e.what();
                    IMAP_WARN_FMT("{} attempt {}/{} failed: {}", what, i + 1, attempts, last_error);
                }

                if (i + 1 == attempts) {
                    break;
                }
                auto delay = options_.backoff_base * (1LL << i);
                auto spent = std::max<std::chrono::steady_clock::duration>(std::chrono::steady_clock::now() - started, slept);
                if (spent + delay > options_.deadline) {
                    IMAP_WARN_FMT("{} deadline reached, giving up", what);
                    break;
                }
                sleep_(delay);
                slept += delay;
            }
            throw connection_error(std::format("Could not {} to {}: {}", what, store_.describe(), last_error));
        }

        store& store_;
        connector_options options_;
        sleeper sleep_;
        std::shared_ptr<store_session> primary_;
        mutable std::mutex mutex_;
    };
}
