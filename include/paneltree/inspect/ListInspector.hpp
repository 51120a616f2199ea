#pragma once

#include <paneltree/list/NodeList.hpp>

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace PT {

struct InspectOptions {
    // Sub-list levels below the root to describe; deeper lists are reported as truncated.
    std::size_t max_depth   = 16;
    bool        include_ids  = true;
};

/**
 * Structural snapshot of a list tree for debugging tools.
 *
 * Every entry has "kind" and "len". Composites add "sublists"; sorting lists add
 * "sort_fresh" and "sort_map"; panels add "naturally_sorted", "z_order" and
 * "z_sort_count"; vector-backed lists add "widgets" when ids are included.
 *
 * Reading the sort map or z order may rebuild it, so the list is taken by reference.
 */
[[nodiscard]] auto inspect_list(NodeList& list, InspectOptions const& options = {}) -> nlohmann::json;

[[nodiscard]] auto inspect_list_dump(NodeList& list, int indent = 2) -> std::string;

} // namespace PT
