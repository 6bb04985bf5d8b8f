#ifndef LNP_REGISTRY_HPP
#define LNP_REGISTRY_HPP

/**
 * @file lnp_registry.hpp
 * @brief Immutable code -> routine dispatch table
 *
 * Built once from a complete list of entries, sorted, checked for duplicate
 * keys, then only read. Lookups are a binary search over a contiguous vector
 * and take no lock, so one table can serve any number of concurrent decoders.
 *
 * Used for the top-level message registry (uint16 code -> payload decoder)
 * and for TLV known-type tables (Type -> record validator).
 */

#include "lnp_logger.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lnp {

/**
 * @brief true when no two elements of codes are equal
 *
 * Usable in static_assert over the type codes of a closed message set.
 */
template <typename Key, size_t N>
constexpr bool all_distinct(const std::array<Key, N>& codes) {
    for (size_t i = 0; i < N; ++i) {
        for (size_t j = i + 1; j < N; ++j) {
            if (codes[i] == codes[j]) return false;
        }
    }
    return true;
}

template <typename Key, typename Fn>
class DispatchTable {
public:
    struct Entry {
        Key key;
        Fn fn;
    };

    using const_iterator = typename std::vector<Entry>::const_iterator;

    DispatchTable() = default;

    /**
     * @throws std::logic_error on a duplicate key; a registry that maps one
     *         code twice is a build defect, not a data error
     */
    DispatchTable(std::initializer_list<Entry> entries, const std::string& name = "dispatch table")
        : entries_(entries) {
        build(name);
    }

    DispatchTable(std::vector<Entry> entries, const std::string& name = "dispatch table")
        : entries_(std::move(entries)) {
        build(name);
    }

    /// nullptr when the key is not registered
    const Fn* find(const Key& key) const {
        auto it = std::lower_bound(entries_.begin(), entries_.end(), key,
            [](const Entry& e, const Key& k) { return e.key < k; });
        if (it == entries_.end() || it->key != key) return nullptr;
        return &it->fn;
    }

    bool contains(const Key& key) const { return find(key) != nullptr; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<Key> keys() const {
        std::vector<Key> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.key);
        return out;
    }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    void build(const std::string& name) {
        std::stable_sort(entries_.begin(), entries_.end(),
            [](const Entry& a, const Entry& b) { return a.key < b.key; });

        auto dup = std::adjacent_find(entries_.begin(), entries_.end(),
            [](const Entry& a, const Entry& b) { return a.key == b.key; });
        if (dup != entries_.end()) {
            std::ostringstream oss;
            oss << name << ": duplicate registration for code " << dup->key;
            LNP_LOG_ERROR(oss.str());
            throw std::logic_error(oss.str());
        }
    }

    std::vector<Entry> entries_;
};

} // namespace lnp

#endif // LNP_REGISTRY_HPP
