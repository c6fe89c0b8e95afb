#include "sv-core/gc.hh"

#include <sstream>

#include "sv-core/feedback.hh"

namespace sv {

    GcCycleReport collect_garbage(Heap& heap, std::vector<ObjectID> const& roots) {
        GcCycleReport report;
        report.live_before = heap.size();
        report.marked = gc::mark_from_roots(heap, roots);
        report.swept = gc::sweep(heap);

        if (debug_feedback_enabled()) {
            std::stringstream ss;
            ss << "GC: " << report.live_before << " -> " << heap.size() << " live objects"
               << " (" << roots.size() << " roots, " << report.swept << " swept)";
            debug(ss.str());
        }
        return report;
    }

}   // namespace sv

namespace sv::gc {

    size_t mark_from_roots(Heap& heap, std::vector<ObjectID> const& roots) {
        size_t marked_count = 0;
        std::vector<ObjectID> work_list(roots.rbegin(), roots.rend());

        while (!work_list.empty()) {
            ObjectID id = work_list.back();
            work_list.pop_back();

            Object* obj = heap.get(id);
            if (obj == nullptr) {
                std::stringstream ss;
                ss << "GC: skipping stale reference (" << id << ")";
                warning(ss.str());
                continue;
            }
            if (obj->marked) {
                continue;
            }
            obj->marked = true;
            marked_count++;

            // pushed in reverse so fields are visited left-to-right
            std::vector<ObjectID> children = obj->value.children();
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                work_list.push_back(*it);
            }
        }
        return marked_count;
    }

    size_t sweep(Heap& heap) {
        size_t swept_count = 0;
        heap.retain([&swept_count] (ObjectID, Object& obj) {
            if (obj.marked) {
                obj.marked = false;
                return true;
            }
            swept_count++;
            return false;
        });
        return swept_count;
    }

}   // namespace sv::gc
