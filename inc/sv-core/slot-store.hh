#pragma once

#include <vector>
#include <optional>
#include <ostream>
#include <sstream>
#include <utility>
#include <cstddef>

#include "sv-core/error.hh"

///
// SlotID, SlotStore:
// A growable table of reusable slots. Each slot carries a generation counter that is bumped
// whenever its occupant is removed, so an ID minted for an earlier occupant never matches a
// later one. All references in the VM are SlotIDs compared by value.
//

namespace sv {

    class SlotID {
    private:
        size_t m_index;
        size_t m_generation;
    public:
        SlotID()
        :   m_index(0),
            m_generation(0)
        {}
        SlotID(size_t index, size_t generation)
        :   m_index(index),
            m_generation(generation)
        {}
    public:
        size_t index() const { return m_index; }
        size_t generation() const { return m_generation; }
    public:
        bool operator==(SlotID const& other) const {
            return m_index == other.m_index && m_generation == other.m_generation;
        }
        bool operator!=(SlotID const& other) const {
            return !(*this == other);
        }
    };

    inline std::ostream& operator<<(std::ostream& out, SlotID id) {
        return out << "#:slot " << id.index() << " #:gen " << id.generation();
    }

    template <typename T>
    class SlotStore {
    private:
        struct Slot {
            size_t generation;
            std::optional<T> payload;
        };
    private:
        std::vector<Slot> m_slots;
        std::vector<size_t> m_free_slots;
        size_t m_live_count;

    public:
        SlotStore()
        :   m_slots(),
            m_free_slots(),
            m_live_count(0)
        {}
        explicit SlotStore(size_t reserved_capacity)
        :   SlotStore()
        {
            m_slots.reserve(reserved_capacity);
        }

    // Insertion:
    public:
        SlotID insert(T value) {
            return insert_with([&value] (SlotID) { return std::move(value); });
        }

        // `make` receives the ID the new payload will live at.
        // The store is left unchanged if `make` throws.
        template <typename F>
        SlotID insert_with(F&& make) {
            bool reuse = !m_free_slots.empty();
            SlotID id = (
                reuse ?
                SlotID{m_free_slots.back(), m_slots[m_free_slots.back()].generation} :
                SlotID{m_slots.size(), 0}
            );
            T payload = make(id);
            if (reuse) {
                m_free_slots.pop_back();
                m_slots[id.index()].payload.emplace(std::move(payload));
            } else {
                m_slots.push_back(Slot{0, std::move(payload)});
            }
            m_live_count++;
            return id;
        }

    // Lookup: a stale or out-of-range ID never yields a payload.
    public:
        bool contains(SlotID id) const {
            return (
                id.index() < m_slots.size() &&
                m_slots[id.index()].generation == id.generation() &&
                m_slots[id.index()].payload.has_value()
            );
        }
        T* get(SlotID id) {
            return contains(id) ? &*m_slots[id.index()].payload : nullptr;
        }
        T const* get(SlotID id) const {
            return contains(id) ? &*m_slots[id.index()].payload : nullptr;
        }
        T& at(SlotID id) {
            T* payload = get(id);
            if (payload == nullptr) {
                throw_stale_reference(help_id_text(id));
            }
            return *payload;
        }
        T const& at(SlotID id) const {
            T const* payload = get(id);
            if (payload == nullptr) {
                throw_stale_reference(help_id_text(id));
            }
            return *payload;
        }

        // The current ID of an occupied slot, regardless of which generation the caller last saw.
        std::optional<SlotID> id_at(size_t index) const {
            if (index < m_slots.size() && m_slots[index].payload.has_value()) {
                return SlotID{index, m_slots[index].generation};
            }
            return std::nullopt;
        }

    // Removal:
    public:
        std::optional<T> remove(SlotID id) {
            if (!contains(id)) {
                return std::nullopt;
            }
            return help_free_slot(id.index());
        }

        // Visits occupied slots in slot order; removes those for which `keep` returns false.
        template <typename F>
        void retain(F&& keep) {
            for (size_t index = 0; index < m_slots.size(); index++) {
                Slot& slot = m_slots[index];
                if (!slot.payload.has_value()) {
                    continue;
                }
                if (!keep(SlotID{index, slot.generation}, *slot.payload)) {
                    help_free_slot(index);
                }
            }
        }

        template <typename F>
        void for_each(F&& cb) const {
            for (size_t index = 0; index < m_slots.size(); index++) {
                Slot const& slot = m_slots[index];
                if (slot.payload.has_value()) {
                    cb(SlotID{index, slot.generation}, *slot.payload);
                }
            }
        }

    // Properties:
    public:
        size_t size() const { return m_live_count; }
        bool empty() const { return m_live_count == 0; }
        size_t capacity() const { return m_slots.size(); }
        void reserve(size_t count) { m_slots.reserve(count); }

    private:
        T help_free_slot(size_t index) {
            Slot& slot = m_slots[index];
            T payload = std::move(*slot.payload);
            slot.payload.reset();
            slot.generation++;
            m_free_slots.push_back(index);
            m_live_count--;
            return payload;
        }
        static std::string help_id_text(SlotID id) {
            std::stringstream ss;
            ss << "(" << id << ")";
            return ss.str();
        }
    };

}   // namespace sv
