#pragma once

#include <vector>
#include <string>
#include <cassert>

#include "sv-core/common.hh"
#include "sv-core/slot-store.hh"

namespace sv {

    using ObjectID = SlotID;

    enum class ValueKind {
        Int,
        Float,
        Struct
    };
    std::string value_kind_name(ValueKind kind);

    ///
    // Value: the closed set of storable data.
    // A Struct holds only references to objects that already existed when it was built.
    //

    class Value {
    private:
        union Scalar {
            i32 i;
            f32 f;
        };
    private:
        ValueKind m_kind;
        Scalar m_scalar;
        std::vector<ObjectID> m_fields;
    private:
        explicit Value(ValueKind kind)
        :   m_kind(kind),
            m_scalar(),
            m_fields()
        {}
    public:
        static Value make_int(i32 v);
        static Value make_float(f32 v);
        static Value make_struct(std::vector<ObjectID> fields);

    public:
        ValueKind kind() const { return m_kind; }
        bool is_int() const { return m_kind == ValueKind::Int; }
        bool is_float() const { return m_kind == ValueKind::Float; }
        bool is_struct() const { return m_kind == ValueKind::Struct; }
        bool is_int(i32 v) const { return is_int() && m_scalar.i == v; }
    public:
        inline i32 as_int() const;
        inline f32 as_float() const;
        inline std::vector<ObjectID> const& fields() const;

    // Direct child references, in field order.
    public:
        std::vector<ObjectID> children() const;
    };

    ///
    // Object: a heap record. Owned by the heap; `marked` is only meaningful during a collection.
    //

    struct Object {
        ObjectID id;
        bool marked;
        Value value;
    public:
        Object(ObjectID new_id, Value new_value)
        :   id(new_id),
            marked(false),
            value(std::move(new_value))
        {}
    };

    using Heap = SlotStore<Object>;

    inline i32 Value::as_int() const {
#if !SV_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        assert(is_int() && "expected Int value");
#endif
        return m_scalar.i;
    }
    inline f32 Value::as_float() const {
#if !SV_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        assert(is_float() && "expected Float value");
#endif
        return m_scalar.f;
    }
    inline std::vector<ObjectID> const& Value::fields() const {
#if !SV_CONFIG_DISABLE_RUNTIME_TYPE_CHECKS
        assert(is_struct() && "expected Struct value");
#endif
        return m_fields;
    }

}   // namespace sv
