#pragma once

/**
 * @file validation_cache.hpp
 * @brief TTL cache of validation results keyed by canonical request hash
 */

#include "secbox/common.hpp"
#include "secbox/language.hpp"
#include "secbox/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace secbox::rules {

/**
 * @brief Thread-safe validation cache
 *
 * Entries expire `ttl` after insertion. When the cache is full the expired
 * entries are dropped first, then the oldest insertion.
 */
class ValidationCache
{
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    ValidationCache(std::chrono::milliseconds ttl, std::size_t capacity, Clock clock = {});

    /**
     * Cache key: "sha256:" + hash of the canonical JSON of {code, language, options}.
     * The performance target is left out since it never changes the result.
     */
    [[nodiscard]] static secbox::Result<std::string>
    make_key(std::string_view code, Language language, const ValidationOptions& options);

    [[nodiscard]] std::optional<ValidationResult> find(const std::string& key);

    void insert(const std::string& key, ValidationResult result);

    void clear();

    [[nodiscard]] std::size_t size() const;

private:
    struct Entry
    {
        ValidationResult result;
        std::chrono::steady_clock::time_point expires_at;
        std::uint64_t sequence = 0;
    };

    void evict_locked(std::chrono::steady_clock::time_point now);

    std::chrono::milliseconds m_ttl;
    std::size_t m_capacity;
    Clock m_clock;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
    std::uint64_t m_next_sequence = 0;
};

}  // namespace secbox::rules
