#include <weave/runtime/TreeDump.hpp>

#include <algorithm>
#include <string_view>
#include <vector>

namespace WV {

namespace {

auto dump_properties(WidgetContainer const& widget, TreeDumpOptions const& options) -> nlohmann::json {
    std::vector<Detail::PropertySlot const*> slots;
    slots.reserve(widget.properties().size());
    for (auto const& [type, slot] : widget.properties())
        slots.push_back(&slot);
    std::sort(slots.begin(), slots.end(), [](auto const* lhs, auto const* rhs) {
        return lhs->cell->name() < rhs->cell->name();
    });

    auto properties = nlohmann::json::array();
    for (auto const* slot : slots) {
        nlohmann::json entry{
            {"name", std::string(slot->cell->name())},
            {"shared", slot->shared},
        };
        if (options.include_values) {
            if (slot->cell->exclusively_borrowed()) {
                entry["borrowed"] = true;
            } else {
                entry["value"] = slot->cell->to_json();
            }
        }
        properties.push_back(std::move(entry));
    }
    return properties;
}

} // namespace

auto DumpTree(WidgetContainer const& root, TreeDumpOptions const& options) -> nlohmann::json {
    nlohmann::json node{
        {"id", root.id()},
        {"name", root.debug_name()},
        {"parent_type", std::string(parentTypeToString(root.parent_type()))},
        {"layout", std::string(Layout::LayoutObjectKind(root.layout_object()))},
        {"state", root.state() != nullptr},
        {"event_handlers", root.event_handlers().size()},
        {"properties", dump_properties(root, options)},
    };
    if (options.include_children) {
        auto children = nlohmann::json::array();
        for (auto const& child : root.children())
            children.push_back(DumpTree(*child, options));
        node["children"] = std::move(children);
    }
    return node;
}

auto DumpTreeString(WidgetContainer const& root, int indent) -> std::string {
    return DumpTree(root).dump(indent);
}

} // namespace WV
