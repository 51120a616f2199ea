#include <paneltree/inspect/ListInspector.hpp>
#include <paneltree/list/PanelList.hpp>
#include <paneltree/list/SortingList.hpp>
#include <paneltree/node/WidgetNode.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace PT {

namespace {

auto describe(NodeList& list, InspectOptions const& options, std::size_t depth) -> nlohmann::json {
    nlohmann::json entry{
        {"kind", std::string(list.kind())},
        {"len", list.len()},
    };

    if (auto* sorting = dynamic_cast<SortingList*>(&list)) {
        entry["sort_fresh"] = sorting->is_sort_fresh();
        entry["sort_map"]   = sorting->sort_map();
    } else if (auto* panel = dynamic_cast<PanelListBase*>(&list)) {
        entry["naturally_sorted"] = panel->is_naturally_sorted();
        entry["z_order"]          = panel->z_order();
        entry["z_sort_count"]     = panel->z_sort_count();
        if (auto id = panel->info_id())
            entry["info_id"] = id->value;
    }

    if (options.include_ids && list.kind() == "vector") {
        auto widgets = nlohmann::json::array();
        list.for_each([&](std::size_t, Node& node) {
            if (auto* widget = node.as_widget())
                widgets.push_back(widget->id().to_string());
            else
                widgets.push_back(nullptr);
        });
        entry["widgets"] = std::move(widgets);
    }

    auto sublists  = nlohmann::json::array();
    bool truncated = false;
    list.for_each_sublist([&](NodeList& sub) {
        if (depth >= options.max_depth) {
            truncated = true;
            return;
        }
        sublists.push_back(describe(sub, options, depth + 1));
    });
    if (!sublists.empty())
        entry["sublists"] = std::move(sublists);
    if (truncated)
        entry["truncated"] = true;
    return entry;
}

} // namespace

auto inspect_list(NodeList& list, InspectOptions const& options) -> nlohmann::json {
    auto snapshot = describe(list, options, 0);
    pt_log("inspect_list kind=" + std::string(list.kind()) + " len=" + std::to_string(list.len()), "Inspect");
    return snapshot;
}

auto inspect_list_dump(NodeList& list, int indent) -> std::string {
    return inspect_list(list).dump(indent);
}

} // namespace PT
