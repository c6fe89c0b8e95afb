#pragma once

#include <vector>
#include <string>
#include <optional>
#include <functional>
#include <ostream>

#include "sv-core/common.hh"
#include "sv-core/object.hh"
#include "sv-core/gc.hh"

namespace sv {

    struct VmConfig {
        size_t max_objects = SV_CONFIG_DEFAULT_MAX_OBJECTS;
        bool gc_enabled = true;
    };

    // Appends root IDs held outside the operand stack (e.g. an engine's locals frames).
    using ExtraRootSource = std::function<void(std::vector<ObjectID>&)>;

    ///
    // VirtualMachine:
    //  - exclusively owns the heap and the operand stack
    //  - the operand stack (plus any extra root source) is the root set for collection
    //  - collects after an allocation pushes the live count above `max_objects`, if enabled
    //

    class VirtualMachine {
    private:
        Heap m_heap;
        std::vector<ObjectID> m_stack;
        size_t m_max_objects;
        bool m_gc_enabled;
        size_t m_gc_cycle_count;
        ExtraRootSource m_extra_root_source;

    public:
        explicit VirtualMachine(VmConfig config = VmConfig{});
        VirtualMachine(VirtualMachine const&) = delete;
        VirtualMachine& operator=(VirtualMachine const&) = delete;

    // Allocation and the operand stack:
    public:
        ObjectID push_value(Value value);
        void push(ObjectID id);
        std::optional<ObjectID> pop();
        std::optional<ObjectID> top() const;
        std::optional<ObjectID> peek(size_t depth) const;

    // Heap access: throws VmError(StaleReference) for a stale ID.
    public:
        Object const& get(ObjectID id) const;
        Object& get_mut(ObjectID id);

    // Collection:
    public:
        void set_gc_enabled(bool on);
        void garbage_collect();
        void set_extra_root_source(ExtraRootSource source);

    // Rendering:
    public:
        std::string display(ObjectID id) const;
        void print(ObjectID id, std::ostream& out) const;

    // Properties:
    public:
        bool gc_enabled() const { return m_gc_enabled; }
        size_t max_objects() const { return m_max_objects; }
        size_t live_count() const { return m_heap.size(); }
        size_t gc_cycle_count() const { return m_gc_cycle_count; }
        std::vector<ObjectID> const& stack() const { return m_stack; }
        Heap const& heap() const { return m_heap; }

    private:
        void help_collect();
    };

}   // namespace sv
