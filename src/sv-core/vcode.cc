#include "sv-core/vcode.hh"

#include "sv-core/printing.hh"

namespace sv {

    ///
    // Constructors by opcode:
    //

    Instruction Instruction::const_int(i32 v) {
        Instruction res{InstrKind::ConstInt};
        res.int_imm = v;
        return res;
    }
    Instruction Instruction::const_float(f32 v) {
        Instruction res{InstrKind::ConstFloat};
        res.float_imm = v;
        return res;
    }
    Instruction Instruction::push_struct(size_t field_count) {
        Instruction res{InstrKind::PushStruct};
        res.n = field_count;
        return res;
    }
    Instruction Instruction::get_struct(size_t field_index) {
        Instruction res{InstrKind::GetStruct};
        res.n = field_index;
        return res;
    }
    Instruction Instruction::get_local(size_t local_index) {
        Instruction res{InstrKind::GetLocal};
        res.n = local_index;
        return res;
    }
    Instruction Instruction::make_label(std::string name) {
        Instruction res{InstrKind::Label};
        res.label = std::move(name);
        return res;
    }
    Instruction Instruction::call(std::string target, size_t arg_count) {
        Instruction res{InstrKind::Call};
        res.label = std::move(target);
        res.n = arg_count;
        return res;
    }
    Instruction Instruction::jump(std::string target) {
        Instruction res{InstrKind::Jump};
        res.label = std::move(target);
        return res;
    }
    Instruction Instruction::jmp_cmp(std::string target) {
        Instruction res{InstrKind::JmpCmp};
        res.label = std::move(target);
        return res;
    }

    bool Instruction::operator==(Instruction const& other) const {
        if (kind != other.kind) {
            return false;
        }
        switch (kind) {
            case InstrKind::ConstInt: return int_imm == other.int_imm;
            case InstrKind::ConstFloat: return float_imm == other.float_imm;
            case InstrKind::PushStruct:
            case InstrKind::GetStruct:
            case InstrKind::GetLocal: return n == other.n;
            case InstrKind::Call: return label == other.label && n == other.n;
            case InstrKind::Label:
            case InstrKind::Jump:
            case InstrKind::JmpCmp: return label == other.label;
            default: return true;
        }
    }

    ///
    // Disassembly:
    //

    char const* instr_kind_name(InstrKind kind) {
        switch (kind) {
            case InstrKind::ConstInt: return "const-int";
            case InstrKind::ConstFloat: return "const-float";
            case InstrKind::PushStruct: return "push-struct";
            case InstrKind::GetStruct: return "get-struct";
            case InstrKind::GetLocal: return "get-local";
            case InstrKind::Label: return "label";
            case InstrKind::IAdd: return "iadd";
            case InstrKind::FAdd: return "fadd";
            case InstrKind::ISub: return "isub";
            case InstrKind::FSub: return "fsub";
            case InstrKind::IMul: return "imul";
            case InstrKind::FMul: return "fmul";
            case InstrKind::Call: return "call";
            case InstrKind::Jump: return "jump";
            case InstrKind::JmpCmp: return "jmp-cmp";
            case InstrKind::CEq: return "c-eq";
            case InstrKind::CNe: return "c-ne";
            case InstrKind::CLt: return "c-lt";
            case InstrKind::CLe: return "c-le";
            case InstrKind::CGt: return "c-gt";
            case InstrKind::CGe: return "c-ge";
            case InstrKind::Return: return "return";
        }
        return "?";
    }

    void print_instruction(Instruction const& instr, std::ostream& out) {
        out << "(" << instr_kind_name(instr.kind);
        switch (instr.kind) {
            case InstrKind::ConstInt: {
                out << ' ' << instr.int_imm;
            } break;
            case InstrKind::ConstFloat: {
                out << ' ';
                print_float(instr.float_imm, out);
            } break;
            case InstrKind::PushStruct:
            case InstrKind::GetStruct:
            case InstrKind::GetLocal: {
                out << ' ' << instr.n;
            } break;
            case InstrKind::Label:
            case InstrKind::Jump:
            case InstrKind::JmpCmp: {
                out << ' ' << instr.label;
            } break;
            case InstrKind::Call: {
                out << " #:label " << instr.label
                    << " #:n " << instr.n;
            } break;
            default: {
                // no operands
            } break;
        }
        out << ")";
    }

    std::ostream& operator<<(std::ostream& out, Instruction const& instr) {
        print_instruction(instr, out);
        return out;
    }

}   // namespace sv
