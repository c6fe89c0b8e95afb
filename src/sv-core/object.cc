#include "sv-core/object.hh"

namespace sv {

    std::string value_kind_name(ValueKind kind) {
        switch (kind) {
            case ValueKind::Int: return "Int";
            case ValueKind::Float: return "Float";
            case ValueKind::Struct: return "Struct";
        }
        return "?";
    }

    Value Value::make_int(i32 v) {
        Value res{ValueKind::Int};
        res.m_scalar.i = v;
        return res;
    }
    Value Value::make_float(f32 v) {
        Value res{ValueKind::Float};
        res.m_scalar.f = v;
        return res;
    }
    Value Value::make_struct(std::vector<ObjectID> fields) {
        Value res{ValueKind::Struct};
        res.m_fields = std::move(fields);
        return res;
    }

    std::vector<ObjectID> Value::children() const {
        switch (m_kind) {
            case ValueKind::Struct: return m_fields;
            case ValueKind::Int:
            case ValueKind::Float: return {};
        }
        return {};
    }

}   // namespace sv
