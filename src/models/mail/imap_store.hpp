#pragma once

#include <format>
#include <memory>
#include <string>

#include "imap_session.hpp"
#include "store.hpp"

namespace mailbridge::mail {
    // Opens authenticated imap_session objects for one account
    class imap_store : public store {
    public:
        explicit imap_store(imap_options options) : options_{std::move(options)} {}

        std::unique_ptr<store_session> open() override {
            auto session = std::make_unique<imap_session>(options_);
            session->connect();
            return session;
        }

        std::string describe() const override {
            return std::format("{} as {}", options_.url, options_.username);
        }

    private:
        imap_options options_;
    };
}
