#pragma once

#include <weave/widget/WidgetContainer.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace WV {

struct TreeDumpOptions {
    bool include_values   = true;
    bool include_children = true;
};

/**
 * Diagnostic snapshot of a widget subtree:
 *
 * {
 *   "id": 1, "name": "TextBox", "parent_type": "single", "layout": "default",
 *   "state": true, "event_handlers": 1,
 *   "properties": [{"name": "focused", "shared": false, "value": false}, ...],
 *   "children": [...]
 * }
 *
 * Properties are sorted by name. Values are null for property types without an
 * nlohmann::json to_json overload. A property that is mutably borrowed while
 * the snapshot is taken is reported as {"borrowed": true} instead of a value.
 */
[[nodiscard]] auto DumpTree(WidgetContainer const& root, TreeDumpOptions const& options = {}) -> nlohmann::json;

[[nodiscard]] auto DumpTreeString(WidgetContainer const& root, int indent = 2) -> std::string;

} // namespace WV
