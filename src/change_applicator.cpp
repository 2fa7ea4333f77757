#include <docsnap-cpp/change_applicator.hpp>

namespace docsnap_cpp {

void apply_changes(Document& doc, std::span<const Change> changes) {
    for (const auto& change : changes) {
        for (const auto& op : change.ops) {
            doc.apply(op);
        }
    }
}

}  // namespace docsnap_cpp
