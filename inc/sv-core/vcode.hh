#pragma once

#include <string>
#include <ostream>
#include <vector>

#include "sv-core/common.hh"
#include "sv-core/slot-store.hh"

///
// Instructions
//

namespace sv {

    using InstrID = SlotID;

    enum class InstrKind {
        ConstInt,
        ConstFloat,
        PushStruct,
        GetStruct,
        GetLocal,
        Label,
        IAdd,
        FAdd,
        ISub,
        FSub,
        IMul,
        FMul,
        Call,
        Jump,
        JmpCmp,
        CEq,
        CNe,
        CLt,
        CLe,
        CGt,
        CGe,
        Return
    };

    ///
    // Instruction: immutable once loaded.
    // Only the fields relevant to `kind` are meaningful:
    //  - `int_imm`:   ConstInt
    //  - `float_imm`: ConstFloat
    //  - `n`:         PushStruct, GetStruct, GetLocal, Call
    //  - `label`:     Label, Call, Jump, JmpCmp
    // `Label` is consumed at load time and never stored or executed.
    //

    struct Instruction {
        InstrKind kind;
        i32 int_imm;
        f32 float_imm;
        size_t n;
        std::string label;
    public:
        explicit Instruction(InstrKind new_kind)
        :   kind(new_kind),
            int_imm(0),
            float_imm(0.0f),
            n(0),
            label()
        {}

    // Constructors by opcode:
    public:
        static Instruction const_int(i32 v);
        static Instruction const_float(f32 v);
        static Instruction push_struct(size_t field_count);
        static Instruction get_struct(size_t field_index);
        static Instruction get_local(size_t local_index);
        static Instruction make_label(std::string name);
        static Instruction iadd() { return Instruction{InstrKind::IAdd}; }
        static Instruction fadd() { return Instruction{InstrKind::FAdd}; }
        static Instruction isub() { return Instruction{InstrKind::ISub}; }
        static Instruction fsub() { return Instruction{InstrKind::FSub}; }
        static Instruction imul() { return Instruction{InstrKind::IMul}; }
        static Instruction fmul() { return Instruction{InstrKind::FMul}; }
        static Instruction call(std::string target, size_t arg_count);
        static Instruction jump(std::string target);
        static Instruction jmp_cmp(std::string target);
        static Instruction ceq() { return Instruction{InstrKind::CEq}; }
        static Instruction cne() { return Instruction{InstrKind::CNe}; }
        static Instruction clt() { return Instruction{InstrKind::CLt}; }
        static Instruction cle() { return Instruction{InstrKind::CLe}; }
        static Instruction cgt() { return Instruction{InstrKind::CGt}; }
        static Instruction cge() { return Instruction{InstrKind::CGe}; }
        static Instruction ret() { return Instruction{InstrKind::Return}; }

    public:
        bool is_label() const { return kind == InstrKind::Label; }
        bool operator==(Instruction const& other) const;
        bool operator!=(Instruction const& other) const { return !(*this == other); }
    };

    using InstrStore = SlotStore<Instruction>;

    // Disassembly, e.g. `(const-int 3)`, `(call #:label f #:n 2)`.
    char const* instr_kind_name(InstrKind kind);
    void print_instruction(Instruction const& instr, std::ostream& out);
    std::ostream& operator<<(std::ostream& out, Instruction const& instr);

}   // namespace sv
