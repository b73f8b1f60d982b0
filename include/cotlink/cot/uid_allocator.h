#pragma once
/**
 * @file uid_allocator.h
 * @brief Session-unique CoT event identifiers
 */

#include "cotlink/core/types.h"
#include <atomic>
#include <string>

namespace cotlink::cot {

/**
 * @brief Issues "<prefix>-<n>" identifiers, never reusing one
 *
 * Without an explicit prefix a random session prefix is generated, so two
 * runs feeding the same client do not collide.
 */
class UidAllocator {
public:
    explicit UidAllocator(std::string prefix = {});

    std::string next();

    const std::string& prefix() const noexcept { return prefix_; }

    /// Number of identifiers issued so far
    UInt64 issued() const noexcept { return counter_.load(); }

    static std::string random_session_prefix();

private:
    std::string prefix_;
    std::atomic<UInt64> counter_{0};
};

} // namespace cotlink::cot
