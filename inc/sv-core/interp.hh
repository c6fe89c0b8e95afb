#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "sv-core/common.hh"
#include "sv-core/object.hh"
#include "sv-core/vcode.hh"
#include "sv-core/vm.hh"

namespace sv {

    ///
    // Frame: the single live execution context.
    // `Call` pushes a locals entry; nothing ever pops one, since `Return` halts the whole run.
    //

    struct Frame {
        InstrID instr_ptr;
        std::vector<std::vector<ObjectID>> locals_stack;
    public:
        void move_to(InstrID id) { instr_ptr = id; }
    };

    ///
    // Interpreter:
    //  - owns the VM, the instruction store, the label table, and the frame
    //  - the instruction store is append-only and is never mutated during `run`
    //  - 'next' instruction means next slot in load order, independent of labels
    //

    class Interpreter {
    private:
        enum class StepKind {
            Next,
            Jump,
            Halt
        };
        struct Step {
            StepKind kind;
            InstrID target;
        };

    private:
        VirtualMachine m_vm;
        InstrStore m_instructions;
        UnstableHashMap<std::string, InstrID> m_labels;
        Frame m_frame;

    private:
        Interpreter(VmConfig config, size_t reserved_instruction_count);
    public:
        Interpreter(Interpreter const&) = delete;
        Interpreter& operator=(Interpreter const&) = delete;

    // Loading: returns null if there is no executable instruction.
    public:
        static std::unique_ptr<Interpreter> load(
            std::vector<Instruction> instructions,
            VmConfig config = VmConfig{}
        );

    // Execution: returns the top of the operand stack when execution stops.
    // Throws VmError on any opcode failure; the instance must not be reused afterward.
    public:
        ObjectID run();

    // Rendering:
    public:
        std::string display(ObjectID id) const { return m_vm.display(id); }
        void print(ObjectID id, std::ostream& out) const { m_vm.print(id, out); }

    // Properties:
    public:
        void set_gc_enabled(bool on) { m_vm.set_gc_enabled(on); }
        VirtualMachine& vm() { return m_vm; }
        VirtualMachine const& vm() const { return m_vm; }
        size_t instruction_count() const { return m_instructions.size(); }
        std::optional<InstrID> label_target(std::string const& name) const;
        size_t locals_depth() const { return m_frame.locals_stack.size(); }
        InstrID instruction_pointer() const { return m_frame.instr_ptr; }

    // Dump:
    public:
        void dump(std::ostream& out) const;

    private:
        Step execute(Instruction const& instr);
        InstrID resolve_label(std::string const& name) const;
        ObjectID pop_operand();
        std::vector<ObjectID> pop_operands(size_t count);
        std::pair<ObjectID, ObjectID> pop_binop();
        void exec_arith(InstrKind kind);
        template <typename Cmp>
        void exec_compare(Cmp cmp);
        [[noreturn]] void throw_binop_mismatch(ObjectID a, ObjectID b) const;
    };

}   // namespace sv
