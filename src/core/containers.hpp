#pragma once

#include <ankerl/unordered_dense.h>

namespace sluice::core {

// Container alias backed by ankerl::unordered_dense
//
// Dense storage keeps entries contiguous, so iterating every live session on
// shutdown is cheap. Iterators invalidate on insertion and erasure (like
// std::vector), so never hold one across a call that may tear a session down.
//
// Usage:
//   sluice::core::fast_map<uint64_t, std::unique_ptr<Session>> sessions;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

}  // namespace sluice::core
