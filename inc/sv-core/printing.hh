#pragma once

#include <ostream>
#include <string>
#include "sv-core/object.hh"

namespace sv {

    // Canonical text: `42i`, `2.5f`, `Struct(1i, Struct(2f))`.
    // Throws VmError(StaleReference) for a dangling ID, VmError(IO) if `out` fails.
    void print_obj(Heap const& heap, ObjectID id, std::ostream& out);
    void print_value(Heap const& heap, Value const& value, std::ostream& out);

    std::string obj_to_string(Heap const& heap, ObjectID id);

    // Shortest round-trip decimal digits without an exponent: `1234567`, `0.1`, `2`.
    void print_float(f32 v, std::ostream& out);

}   // namespace sv
