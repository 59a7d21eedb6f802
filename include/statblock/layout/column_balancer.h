#pragma once
#include <statblock/core/config.h>
#include <statblock/model/value.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace statblock::layout {

// Column policy for one render pass.
struct ColumnConfig {
    std::optional<int> record_columns;  // explicit positive count from the record
    std::optional<float> max_height;    // record columnHeight, unbounded when unset
    bool force_columns = false;
    int max_columns = core::config::kDefaultMaxColumns;
};

// Block indices per column, in document order.
struct ColumnAssignment {
    float split_height = 0;
    std::vector<std::vector<std::size_t>> columns;

    std::size_t column_count() const { return columns.size(); }
};

float total_height(const std::vector<float>& heights);

// Per-column height budget:
//   force_columns         -> total / max_columns
//   record column count k -> max(total / k, total / columns)
//   otherwise             -> total / columns, at least kMinSplitHeight,
//                            at most max_height
float split_height(float total, int columns, const ColumnConfig& config);

// Greedy left-to-right fill. A block moves to a new column when the current
// one is non-empty and would exceed the split height with it. Blocks are
// never split or reordered. With force_columns the count stops at
// max_columns and the last column takes the rest.
ColumnAssignment assign_columns(const std::vector<float>& heights, int columns,
                                const ColumnConfig& config);

template <typename Block>
std::vector<std::vector<Block>> group_by_column(std::vector<Block> blocks,
                                                const ColumnAssignment& assignment) {
    std::vector<std::vector<Block>> grouped;
    grouped.reserve(assignment.columns.size());
    for (const auto& column : assignment.columns) {
        std::vector<Block> out;
        out.reserve(column.size());
        for (std::size_t index : column) {
            if (index < blocks.size()) out.push_back(std::move(blocks[index]));
        }
        grouped.push_back(std::move(out));
    }
    return grouped;
}

// Reads columns, columnHeight and forceColumns from the record. Non-positive
// or non-numeric values are ignored.
ColumnConfig column_config_from_record(const model::DataRecord& record, int max_columns);

// columnWidth as CSS: a number becomes "<n>px", a string is used as is,
// anything else gives the fallback.
std::string resolve_column_width(const model::DataRecord& record, const std::string& fallback);

} // namespace statblock::layout
