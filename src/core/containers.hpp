#pragma once

#include <ankerl/unordered_dense.h>

#include <string_view>

namespace veritas::core {

// Lookup table aliases backed by ankerl::unordered_dense.
// Dense contiguous storage keeps the small read-only tables (IBAN lengths,
// reserved device names) in a handful of cache lines.
//
// Usage:
//   veritas::core::fast_map<std::string_view, std::size_t> lengths;
//   veritas::core::fast_set<std::string_view> reserved;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace veritas::core
