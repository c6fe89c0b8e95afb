#pragma once

#include <vector>
#include "sv-core/object.hh"

///
// Mark-sweep collection over a Heap.
// Roots are supplied by the owner (the VM's operand stack); everything not transitively reachable
// from them through Struct fields is removed in the same pass.
//

namespace sv {

    struct GcCycleReport {
        size_t live_before;
        size_t marked;
        size_t swept;
    };

    // Always runs both phases. Never fails; safe on an empty heap.
    // On return every surviving object has `marked == false`.
    GcCycleReport collect_garbage(Heap& heap, std::vector<ObjectID> const& roots);

}   // namespace sv

namespace sv::gc {

    // Uses an explicit work-list, so nesting depth does not grow the call stack.
    // Returns the number of objects newly marked.
    size_t mark_from_roots(Heap& heap, std::vector<ObjectID> const& roots);

    // Removes every unmarked object and clears the mark on the rest. Returns the number removed.
    size_t sweep(Heap& heap);

}   // namespace sv::gc
