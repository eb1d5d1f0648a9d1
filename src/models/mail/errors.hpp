#pragma once

#include <stdexcept>
#include <string>

namespace mailbridge::mail {
    // The mail store could not be reached after every retry
    class connection_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // A mailbox could not be resolved (unknown identity, not configured)
    class mailbox_not_found_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Every strategy failed for every folder of a mailbox, or every mailbox failed
    class search_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}

namespace mailbridge {
    // A tool parameter is missing or malformed; raised before the mail store is touched
    class validation_error : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };
}
