#include "sv-core/interp.hh"

#include <algorithm>
#include <functional>
#include <iomanip>
#include <sstream>

#include "sv-core/config.hh"
#include "sv-core/error.hh"
#include "sv-core/feedback.hh"

namespace sv {

    //
    // Wrapping 32-bit integer arithmetic:
    //

    static i32 wrapping_add(i32 a, i32 b) {
        return static_cast<i32>(static_cast<uint32_t>(a) + static_cast<uint32_t>(b));
    }
    static i32 wrapping_sub(i32 a, i32 b) {
        return static_cast<i32>(static_cast<uint32_t>(a) - static_cast<uint32_t>(b));
    }
    static i32 wrapping_mul(i32 a, i32 b) {
        return static_cast<i32>(static_cast<uint32_t>(a) * static_cast<uint32_t>(b));
    }

    //
    // ctor, loading:
    //

    Interpreter::Interpreter(VmConfig config, size_t reserved_instruction_count)
    :   m_vm(config),
        m_instructions(reserved_instruction_count),
        m_labels(),
        m_frame()
    {
        // only the innermost locals are reachable through `GetLocal`; outer entries are dead
        m_vm.set_extra_root_source([this] (std::vector<ObjectID>& roots) {
            if (!m_frame.locals_stack.empty()) {
                auto const& locals = m_frame.locals_stack.back();
                roots.insert(roots.end(), locals.begin(), locals.end());
            }
        });
    }

    std::unique_ptr<Interpreter> Interpreter::load(std::vector<Instruction> instructions, VmConfig config) {
        std::unique_ptr<Interpreter> interp{new Interpreter(config, instructions.size())};

        std::vector<std::string> pending_labels;
        std::optional<InstrID> first_instr;
        for (Instruction& instr: instructions) {
            if (instr.is_label()) {
                pending_labels.push_back(std::move(instr.label));
                continue;
            }

            InstrID id = interp->m_instructions.insert(std::move(instr));
            if (!first_instr.has_value()) {
                first_instr = id;
            }
            for (std::string const& name: pending_labels) {
                if (interp->m_labels.count(name) != 0) {
                    warning("Loader: label `" + name + "` redefined; the later definition wins.");
                }
                interp->m_labels[name] = id;
            }
            pending_labels.clear();
        }
        for (std::string const& name: pending_labels) {
            warning("Loader: label `" + name + "` is not followed by any instruction; dropped.");
        }

        if (!first_instr.has_value()) {
            return nullptr;
        }
        interp->m_frame.move_to(*first_instr);
        return interp;
    }

    std::optional<InstrID> Interpreter::label_target(std::string const& name) const {
        auto found_it = m_labels.find(name);
        if (found_it == m_labels.end()) {
            return std::nullopt;
        }
        return found_it->second;
    }

    //
    // Fetch-decode-execute:
    //

    ObjectID Interpreter::run() {
        bool is_running = true;
        while (is_running) {
            InstrID ip = m_frame.instr_ptr;
            Instruction const* instr = m_instructions.get(ip);
            if (instr == nullptr) {
                // past the last slot: controlled stop; a stale slot is a broken pointer
                if (ip.index() < m_instructions.capacity()) {
                    throw_invalid_instruction_pointer();
                }
                break;
            }

#if SV_CONFIG_PRINT_EACH_INSTRUCTION_ON_EXECUTION
            {
                std::stringstream ss;
                ss << "VM <- (" << ip.index() << ") " << *instr;
                debug(ss.str());
            }
#endif

            Step step = execute(*instr);
            switch (step.kind) {
                case StepKind::Next: {
                    std::optional<InstrID> next = m_instructions.id_at(ip.index() + 1);
                    if (next.has_value()) {
                        m_frame.move_to(*next);
                    } else {
                        is_running = false;
                    }
                } break;
                case StepKind::Jump: {
                    m_frame.move_to(step.target);
                } break;
                case StepKind::Halt: {
                    is_running = false;
                } break;
            }
        }

        std::optional<ObjectID> top = m_vm.top();
        if (!top.has_value()) {
            throw_stack_underflow();
        }
        return *top;
    }

    Interpreter::Step Interpreter::execute(Instruction const& instr) {
        Step next_step{StepKind::Next, InstrID{}};

        switch (instr.kind) {
            case InstrKind::ConstInt: {
                m_vm.push_value(Value::make_int(instr.int_imm));
            } break;
            case InstrKind::ConstFloat: {
                m_vm.push_value(Value::make_float(instr.float_imm));
            } break;
            case InstrKind::PushStruct: {
                std::vector<ObjectID> fields = pop_operands(instr.n);
                m_vm.push_value(Value::make_struct(std::move(fields)));
            } break;
            case InstrKind::GetStruct: {
                ObjectID s = pop_operand();
                Value const& s_value = m_vm.get(s).value;
                if (!s_value.is_struct() || instr.n >= s_value.fields().size()) {
                    throw_value_mismatch(m_vm.display(s));
                }
                m_vm.push(s_value.fields()[instr.n]);
            } break;
            case InstrKind::GetLocal: {
                if (m_frame.locals_stack.empty()) {
                    throw_stack_underflow();
                }
                auto const& locals = m_frame.locals_stack.back();
                if (instr.n >= locals.size()) {
                    throw_stack_underflow();
                }
                m_vm.push(locals[instr.n]);
            } break;
            case InstrKind::Label: {
                // consumed by the loader
            } break;
            case InstrKind::IAdd:
            case InstrKind::FAdd:
            case InstrKind::ISub:
            case InstrKind::FSub:
            case InstrKind::IMul:
            case InstrKind::FMul: {
                exec_arith(instr.kind);
            } break;
            case InstrKind::CEq: exec_compare(std::equal_to<>{}); break;
            case InstrKind::CNe: exec_compare(std::not_equal_to<>{}); break;
            case InstrKind::CLt: exec_compare(std::less<>{}); break;
            case InstrKind::CLe: exec_compare(std::less_equal<>{}); break;
            case InstrKind::CGt: exec_compare(std::greater<>{}); break;
            case InstrKind::CGe: exec_compare(std::greater_equal<>{}); break;
            case InstrKind::Call: {
                InstrID target = resolve_label(instr.label);
                m_frame.locals_stack.push_back(pop_operands(instr.n));
                next_step = {StepKind::Jump, target};
            } break;
            case InstrKind::Jump: {
                next_step = {StepKind::Jump, resolve_label(instr.label)};
            } break;
            case InstrKind::JmpCmp: {
                InstrID target = resolve_label(instr.label);
                ObjectID cond = pop_operand();
                Value const& cond_value = m_vm.get(cond).value;
                if (cond_value.is_int(1)) {
                    next_step = {StepKind::Jump, target};
                } else if (!cond_value.is_int(0)) {
                    throw_value_mismatch(m_vm.display(cond));
                }
            } break;
            case InstrKind::Return: {
                next_step.kind = StepKind::Halt;
            } break;
        }
        return next_step;
    }

    //
    // Operand helpers:
    //

    InstrID Interpreter::resolve_label(std::string const& name) const {
        auto found_it = m_labels.find(name);
        if (found_it == m_labels.end()) {
            throw_unresolved_label(name);
        }
        return found_it->second;
    }

    ObjectID Interpreter::pop_operand() {
        std::optional<ObjectID> id = m_vm.pop();
        if (!id.has_value()) {
            throw_stack_underflow();
        }
        return *id;
    }

    // Pops `count` operands, returned in push order (left-to-right).
    std::vector<ObjectID> Interpreter::pop_operands(size_t count) {
        std::vector<ObjectID> ids;
        ids.reserve(count);
        for (size_t i = 0; i < count; i++) {
            ids.push_back(pop_operand());
        }
        std::reverse(ids.begin(), ids.end());
        return ids;
    }

    std::pair<ObjectID, ObjectID> Interpreter::pop_binop() {
        ObjectID b = pop_operand();
        ObjectID a = pop_operand();
        return {a, b};
    }

    void Interpreter::throw_binop_mismatch(ObjectID a, ObjectID b) const {
        std::stringstream ss;
        ss << m_vm.display(a) << ", " << m_vm.display(b);
        throw_value_mismatch(ss.str());
    }

    void Interpreter::exec_arith(InstrKind kind) {
        auto [a, b] = pop_binop();
        Value const& va = m_vm.get(a).value;
        Value const& vb = m_vm.get(b).value;

        bool is_int_op = (kind == InstrKind::IAdd || kind == InstrKind::ISub || kind == InstrKind::IMul);
        if (is_int_op && va.is_int() && vb.is_int()) {
            i32 x = va.as_int();
            i32 y = vb.as_int();
            i32 res = 0;
            switch (kind) {
                case InstrKind::IAdd: res = wrapping_add(x, y); break;
                case InstrKind::ISub: res = wrapping_sub(x, y); break;
                default: res = wrapping_mul(x, y); break;
            }
            m_vm.push_value(Value::make_int(res));
            return;
        }
        if (!is_int_op && va.is_float() && vb.is_float()) {
            f32 x = va.as_float();
            f32 y = vb.as_float();
            f32 res = 0.0f;
            switch (kind) {
                case InstrKind::FAdd: res = x + y; break;
                case InstrKind::FSub: res = x - y; break;
                default: res = x * y; break;
            }
            m_vm.push_value(Value::make_float(res));
            return;
        }
        throw_binop_mismatch(a, b);
    }

    template <typename Cmp>
    void Interpreter::exec_compare(Cmp cmp) {
        auto [a, b] = pop_binop();
        Value const& va = m_vm.get(a).value;
        Value const& vb = m_vm.get(b).value;

        bool holds = false;
        if (va.is_int() && vb.is_int()) {
            holds = cmp(va.as_int(), vb.as_int());
        } else if (va.is_float() && vb.is_float()) {
            holds = cmp(va.as_float(), vb.as_float());
        } else {
            throw_binop_mismatch(a, b);
        }
        m_vm.push_value(Value::make_int(holds ? 1 : 0));
    }

    //
    // Dump:
    //

    void Interpreter::dump(std::ostream& out) const {
        // width of the largest slot index
        size_t slot_count = m_instructions.capacity();
        size_t pad_w = 1;
        for (size_t max_index = (slot_count > 0 ? slot_count - 1 : 0); max_index >= 10; max_index /= 10) {
            pad_w++;
        }

        out << "--- INSTRUCTIONS ---" << std::endl;
        m_instructions.for_each([&out, pad_w] (InstrID id, Instruction const& instr) {
            out << "  [" << std::setfill('0') << std::setw(pad_w) << id.index() << "] ";
            print_instruction(instr, out);
            out << std::endl;
        });

        std::vector<std::pair<size_t, std::string>> labels;
        labels.reserve(m_labels.size());
        for (auto const& entry: m_labels) {
            labels.emplace_back(entry.second.index(), entry.first);
        }
        std::sort(labels.begin(), labels.end());

        out << "--- LABELS ---" << std::endl;
        for (auto const& [index, name]: labels) {
            out << "  " << name << " => [" << std::setfill('0') << std::setw(pad_w) << index << "]" << std::endl;
        }
    }

}   // namespace sv
