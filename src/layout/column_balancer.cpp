#include <statblock/layout/column_balancer.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace statblock::layout {

namespace {

// Accumulated float heights drift; a column may overshoot by this much.
constexpr float kOverflowTolerance = 0.01f;

} // anonymous namespace

float total_height(const std::vector<float>& heights) {
    float total = 0;
    for (float h : heights) {
        if (h > 0) total += h;
    }
    return total;
}

float split_height(float total, int columns, const ColumnConfig& config) {
    if (columns < 1) columns = 1;

    if (config.force_columns) {
        int max_columns = std::max(1, config.max_columns);
        return total / static_cast<float>(max_columns);
    }

    if (config.record_columns && *config.record_columns > 0) {
        return std::max(total / static_cast<float>(*config.record_columns),
                        total / static_cast<float>(columns));
    }

    float split = std::max(total / static_cast<float>(columns),
                           static_cast<float>(core::config::kMinSplitHeight));
    if (config.max_height && *config.max_height > 0) {
        split = std::min(split, *config.max_height);
    }
    return split;
}

ColumnAssignment assign_columns(const std::vector<float>& heights, int columns,
                                const ColumnConfig& config) {
    ColumnAssignment assignment;
    assignment.split_height = split_height(total_height(heights), columns, config);
    if (heights.empty()) return assignment;

    std::size_t column_limit = std::numeric_limits<std::size_t>::max();
    if (config.force_columns) {
        column_limit = static_cast<std::size_t>(std::max(1, config.max_columns));
    }

    assignment.columns.emplace_back();
    float col_y = 0;
    for (std::size_t i = 0; i < heights.size(); ++i) {
        float h = heights[i] > 0 ? heights[i] : 0;

        // Move to the next column if this block would exceed the budget
        bool overflow = col_y + h > assignment.split_height + kOverflowTolerance;
        if (overflow && !assignment.columns.back().empty() &&
            assignment.columns.size() < column_limit) {
            assignment.columns.emplace_back();
            col_y = 0;
        }

        assignment.columns.back().push_back(i);
        col_y += h;
    }
    return assignment;
}

ColumnConfig column_config_from_record(const model::DataRecord& record, int max_columns) {
    ColumnConfig config;
    config.max_columns = max_columns;

    if (auto columns = record.number("columns"); columns && *columns >= 1) {
        config.record_columns = static_cast<int>(std::floor(*columns));
    }
    if (auto height = record.number("columnHeight"); height && *height > 0) {
        config.max_height = static_cast<float>(*height);
    }
    if (const model::Value* force = record.get("forceColumns")) {
        config.force_columns = force->as_bool();
    }
    return config;
}

std::string resolve_column_width(const model::DataRecord& record, const std::string& fallback) {
    const model::Value* width = record.get("columnWidth");
    if (!width) return fallback;
    if (width->is_number()) return model::format_number(width->as_number()) + "px";
    if (width->is_string() && !width->as_string().empty()) return width->as_string();
    return fallback;
}

} // namespace statblock::layout
