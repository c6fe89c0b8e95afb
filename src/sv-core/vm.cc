#include "sv-core/vm.hh"

#include "sv-core/feedback.hh"
#include "sv-core/printing.hh"

namespace sv {

    VirtualMachine::VirtualMachine(VmConfig config)
    :   m_heap(),
        m_stack(),
        m_max_objects(config.max_objects),
        m_gc_enabled(config.gc_enabled),
        m_gc_cycle_count(0),
        m_extra_root_source()
    {
        m_heap.reserve(m_max_objects + 1);
    }

    //
    // Allocation and the operand stack:
    //

    ObjectID VirtualMachine::push_value(Value value) {
        ObjectID id = m_heap.insert_with([&value] (ObjectID new_id) {
            return Object{new_id, std::move(value)};
        });
        push(id);
        if (m_heap.size() > m_max_objects) {
            garbage_collect();
        }
        return id;
    }

    void VirtualMachine::push(ObjectID id) {
        m_stack.push_back(id);
    }

    std::optional<ObjectID> VirtualMachine::pop() {
        if (m_stack.empty()) {
            return std::nullopt;
        }
        ObjectID id = m_stack.back();
        m_stack.pop_back();
        return id;
    }

    std::optional<ObjectID> VirtualMachine::top() const {
        return peek(0);
    }

    std::optional<ObjectID> VirtualMachine::peek(size_t depth) const {
        if (depth >= m_stack.size()) {
            return std::nullopt;
        }
        return m_stack[m_stack.size() - 1 - depth];
    }

    //
    // Heap access:
    //

    Object const& VirtualMachine::get(ObjectID id) const {
        return m_heap.at(id);
    }
    Object& VirtualMachine::get_mut(ObjectID id) {
        return m_heap.at(id);
    }

    //
    // Collection:
    //

    void VirtualMachine::set_gc_enabled(bool on) {
        m_gc_enabled = on;
        if (m_gc_enabled && m_heap.size() > m_max_objects) {
            help_collect();
        }
    }

    void VirtualMachine::garbage_collect() {
        if (!m_gc_enabled) {
            return;
        }
        help_collect();
    }

    void VirtualMachine::set_extra_root_source(ExtraRootSource source) {
        m_extra_root_source = std::move(source);
    }

    void VirtualMachine::help_collect() {
        std::vector<ObjectID> roots(m_stack);
        if (m_extra_root_source) {
            m_extra_root_source(roots);
        }
        collect_garbage(m_heap, roots);
        m_gc_cycle_count++;
    }

    //
    // Rendering:
    //

    std::string VirtualMachine::display(ObjectID id) const {
        return obj_to_string(m_heap, id);
    }
    void VirtualMachine::print(ObjectID id, std::ostream& out) const {
        print_obj(m_heap, id, out);
    }

}   // namespace sv
