/**
 * @file uid_allocator.cpp
 * @brief UID allocator implementation
 */

#include "cotlink/cot/uid_allocator.h"
#include <cstdio>
#include <random>

namespace cotlink::cot {

UidAllocator::UidAllocator(std::string prefix)
    : prefix_(prefix.empty() ? random_session_prefix() : std::move(prefix)) {}

std::string UidAllocator::next() {
    UInt64 n = ++counter_;
    return prefix_ + "-" + std::to_string(n);
}

std::string UidAllocator::random_session_prefix() {
    std::random_device rd;
    std::uniform_int_distribution<UInt32> dist;
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "cotlink-%08x", dist(rd));
    return buffer;
}

} // namespace cotlink::cot
