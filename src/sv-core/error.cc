#include "sv-core/error.hh"

#include <sstream>

namespace sv {

    char const* vm_error_kind_name(VmErrorKind kind) {
        switch (kind) {
            case VmErrorKind::ValueMismatch: return "ValueMismatch";
            case VmErrorKind::StackUnderflow: return "StackUnderflow";
            case VmErrorKind::UnresolvedLabel: return "UnresolvedLabel";
            case VmErrorKind::InvalidInstructionPointer: return "InvalidInstructionPointer";
            case VmErrorKind::StaleReference: return "StaleReference";
            case VmErrorKind::IO: return "IO";
        }
        return "Unknown";
    }

    static std::string help_vm_error_text(VmErrorKind kind, std::string const& detail) {
        std::stringstream ss;
        switch (kind) {
            case VmErrorKind::ValueMismatch: {
                ss << "Value type mismatch, unexpected " << detail;
            } break;
            case VmErrorKind::StackUnderflow: {
                ss << "Interpreter stack underflow";
            } break;
            case VmErrorKind::UnresolvedLabel: {
                ss << "Unresolved label " << detail;
            } break;
            case VmErrorKind::InvalidInstructionPointer: {
                ss << "Invalid instruction pointer state";
            } break;
            case VmErrorKind::StaleReference: {
                ss << "Stale or invalid heap reference " << detail;
            } break;
            case VmErrorKind::IO: {
                ss << "IO error: " << detail;
            } break;
        }
        return ss.str();
    }

    VmError::VmError(VmErrorKind kind, std::string detail)
    :   SvError(help_vm_error_text(kind, detail)),
        m_kind(kind),
        m_detail(std::move(detail))
    {}

    [[noreturn]] static void help_report_and_throw(VmErrorKind kind, std::string detail) {
        VmError e{kind, std::move(detail)};
        error(e.message());
        throw e;
    }

    void throw_value_mismatch(std::string rendered) {
        help_report_and_throw(VmErrorKind::ValueMismatch, std::move(rendered));
    }
    void throw_stack_underflow() {
        help_report_and_throw(VmErrorKind::StackUnderflow, "");
    }
    void throw_unresolved_label(std::string const& label) {
        help_report_and_throw(VmErrorKind::UnresolvedLabel, label);
    }
    void throw_invalid_instruction_pointer() {
        help_report_and_throw(VmErrorKind::InvalidInstructionPointer, "");
    }
    void throw_stale_reference(std::string id_text) {
        help_report_and_throw(VmErrorKind::StaleReference, std::move(id_text));
    }
    void throw_io_error(std::string detail) {
        help_report_and_throw(VmErrorKind::IO, std::move(detail));
    }

}   // namespace sv
