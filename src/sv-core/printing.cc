#include "sv-core/printing.hh"

#include <charconv>
#include <cmath>
#include <sstream>
#include <system_error>

#include "sv-core/error.hh"

namespace sv {

    void print_float(f32 v, std::ostream& out) {
        if (std::isnan(v)) {
            out << "NaN";
            return;
        }
        // shortest digits that read back to the same float, never in exponent form
        char buf[64];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
        if (ec != std::errc{}) {
            throw_io_error("failed to format float");
        }
        out.write(buf, end - buf);
    }

    static void help_print_value(Heap const& heap, Value const& value, std::ostream& out) {
        switch (value.kind()) {
            case ValueKind::Int: {
                out << value.as_int() << 'i';
            } break;
            case ValueKind::Float: {
                print_float(value.as_float(), out);
                out << 'f';
            } break;
            case ValueKind::Struct: {
                out << "Struct(";
                auto const& fields = value.fields();
                for (size_t i = 0; i < fields.size(); i++) {
                    if (i > 0) {
                        out << ", ";
                    }
                    help_print_value(heap, heap.at(fields[i]).value, out);
                }
                out << ')';
            } break;
        }
    }

    void print_value(Heap const& heap, Value const& value, std::ostream& out) {
        help_print_value(heap, value, out);
        if (out.fail()) {
            throw_io_error("failed to write rendered value");
        }
    }

    void print_obj(Heap const& heap, ObjectID id, std::ostream& out) {
        print_value(heap, heap.at(id).value, out);
    }

    std::string obj_to_string(Heap const& heap, ObjectID id) {
        std::stringstream ss;
        print_obj(heap, id, ss);
        return ss.str();
    }

}   // namespace sv
