#pragma once

#include <string>
#include "sv-core/feedback.hh"

namespace sv {

    enum class VmErrorKind {
        ValueMismatch,
        StackUnderflow,
        UnresolvedLabel,
        InvalidInstructionPointer,
        StaleReference,
        IO
    };

    char const* vm_error_kind_name(VmErrorKind kind);

    ///
    // VmError: every failure of `Interpreter::run` and of heap access.
    // Terminal for the interpreter instance that raised it.
    //

    class VmError: public SvError {
    private:
        VmErrorKind m_kind;
        std::string m_detail;
    public:
        VmError(VmErrorKind kind, std::string detail = "");
    public:
        VmErrorKind kind() const { return m_kind; }
        std::string const& detail() const { return m_detail; }
    };

    // Report via `error` then throw.
    [[noreturn]] void throw_value_mismatch(std::string rendered);
    [[noreturn]] void throw_stack_underflow();
    [[noreturn]] void throw_unresolved_label(std::string const& label);
    [[noreturn]] void throw_invalid_instruction_pointer();
    [[noreturn]] void throw_stale_reference(std::string id_text);
    [[noreturn]] void throw_io_error(std::string detail);

}   // namespace sv
