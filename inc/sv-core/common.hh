#pragma once

#include <cstdint>
#include <cstddef>
#include "sv-core/config.hh"
#include "robin_hood.h"

namespace sv {

    template <typename K, typename V>
    using UnstableHashMap = robin_hood::unordered_flat_map<K, V>;

    // VM-level scalar types: fixed width regardless of host.
    using i32 = int32_t;
    using f32 = float;

}   // namespace sv
