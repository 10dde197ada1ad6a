/**
 * @file validation_cache.cpp
 * @brief ValidationCache implementation
 */

#include "secbox/validation_cache.hpp"

#include "secbox/canonical_json.hpp"

#include <algorithm>
#include <ranges>
#include <utility>

#include <nlohmann/json.hpp>

namespace secbox::rules {

ValidationCache::ValidationCache(std::chrono::milliseconds ttl, std::size_t capacity, Clock clock)
    : m_ttl(ttl)
    , m_capacity(std::max<std::size_t>(capacity, 1))
    , m_clock(clock ? std::move(clock) : Clock{[] { return std::chrono::steady_clock::now(); }})
{}

secbox::Result<std::string> ValidationCache::make_key(std::string_view code,
                                                      Language language,
                                                      const ValidationOptions& options)
{
    nlohmann::json categories = nlohmann::json::array();
    for (auto category : options.enabled_categories) {
        categories.push_back(to_string(category));
    }
    nlohmann::json policy;
    to_json(policy, options.policy);

    const nlohmann::json key = {
        {    "code",                       std::string(code)},
        {"language",            std::string(to_string(language))},
        { "options",
         {{"educationalMode", options.educational_mode},
          {"enabledCategories", std::move(categories)},
          {"policy", std::move(policy)}}                        }
    };
    return canonical::hash_canonical(key);
}

std::optional<ValidationResult> ValidationCache::find(const std::string& key)
{
    std::lock_guard lock(m_mutex);
    const auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    if (m_clock() >= it->second.expires_at) {
        m_entries.erase(it);
        return std::nullopt;
    }
    return it->second.result;
}

void ValidationCache::insert(const std::string& key, ValidationResult result)
{
    std::lock_guard lock(m_mutex);
    const auto now = m_clock();
    if (!m_entries.contains(key) && m_entries.size() >= m_capacity) {
        evict_locked(now);
    }
    m_entries.insert_or_assign(key,
                               Entry{.result = std::move(result),
                                     .expires_at = now + m_ttl,
                                     .sequence = m_next_sequence++});
}

void ValidationCache::clear()
{
    std::lock_guard lock(m_mutex);
    m_entries.clear();
}

std::size_t ValidationCache::size() const
{
    std::lock_guard lock(m_mutex);
    return m_entries.size();
}

void ValidationCache::evict_locked(std::chrono::steady_clock::time_point now)
{
    std::erase_if(m_entries, [now](const auto& item) { return now >= item.second.expires_at; });
    if (m_entries.size() < m_capacity) {
        return;
    }
    const auto oldest = std::ranges::min_element(
        m_entries, {}, [](const auto& item) { return item.second.sequence; });
    m_entries.erase(oldest);
}

}  // namespace secbox::rules
