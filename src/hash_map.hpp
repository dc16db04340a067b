#ifndef GFAESTUS_HASH_MAP_HPP_INCLUDED
#define GFAESTUS_HASH_MAP_HPP_INCLUDED

/** \file
 * hash_map.hpp: sparse hash containers keyed with Wang hashes. Node IDs and
 * handles are dense small integers, so the identity std::hash clusters badly.
 */

#include <cstddef>
#include <cstdint>
#include <type_traits>

#include <sparsepp/spp.h>

namespace gfaestus {

/// Mix the bits of a 64-bit integer key (Thomas Wang's hash), so nearby IDs
/// land in different buckets.
inline size_t wang_hash_64(size_t key) {
    key = (~key) + (key << 21);
    key ^= key >> 24;
    key *= 265;
    key ^= key >> 14;
    key *= 21;
    key ^= key >> 28;
    key += key << 31;
    return key;
}

// We need this second type for enable_if-based specialization
template<typename T, typename ImplementationMatched = void>
struct wang_hash;

// We can hash any integer that can be implicitly widened to size_t.
// This also coveres bools.
template<typename T>
struct wang_hash<T, typename std::enable_if<std::is_integral<T>::value>::type> {
    size_t operator()(const T& x) const {
        static_assert(sizeof(T) <= sizeof(size_t), "widest hashable type is size_t");
        return wang_hash_64(static_cast<size_t>(x));
    }
};

/// Sparse replacement for std::unordered_map over integer-like keys.
template<typename K, typename V>
class hash_map : public spp::sparse_hash_map<K, V, wang_hash<K>> {
};

}   // namespace gfaestus

#endif
