#pragma once

#include "http_common.hpp"

#include <cstddef>
#include <string>

namespace convgate::net::http {

/**
 * @brief Joins the header fragments llhttp reports across reads into complete entries.
 *
 * Names are stored lower-cased and values trimmed. The whole header block is capped at
 * `max_bytes`; once it is exceeded every callback reports failure.
 */
class HeaderAccumulator {
public:
    explicit HeaderAccumulator(size_t max_bytes = 64 * 1024) : max_bytes_(max_bytes) { }

    void clear()
    {
        field_.clear();
        value_.clear();
        total_    = 0;
        overflow_ = false;
    }

    bool add_field(const char* at, size_t length)
    {
        field_.append(at, length);
        return account(length);
    }

    bool add_value(const char* at, size_t length)
    {
        value_.append(at, length);
        return account(length);
    }

    // Called on llhttp's value-complete event.
    void commit(Headers& out)
    {
        if (!field_.empty())
            out.push_back({ to_lower(field_), trim(value_) });
        field_.clear();
        value_.clear();
    }

    bool   overflowed() const noexcept { return overflow_; }
    size_t max_bytes() const noexcept { return max_bytes_; }

private:
    bool account(size_t length)
    {
        total_ += length;
        if (total_ > max_bytes_)
            overflow_ = true;
        return !overflow_;
    }

    std::string field_;
    std::string value_;
    size_t      max_bytes_;
    size_t      total_ { 0 };
    bool        overflow_ { false };
};

} // namespace convgate::net::http
