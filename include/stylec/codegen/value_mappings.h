#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylec::codegen {

// Literal CSS values to theme variables, e.g. "#007bff" -> "var(--color-primary)".
// Tables are grouped by category; the category is picked from the property
// name, and properties with no category search every table in order.
class ValueMappings {
public:
    using Table = std::map<std::string, std::string>;

    // Starts with the built-in tables.
    ValueMappings();

    static ValueMappings empty();

    // Merges a JSON object of {category: {value: replacement}} into the
    // tables. Unknown categories are appended. On failure nothing is merged.
    bool merge_json(std::string_view json_text, std::string& err);
    bool load_file(const std::string& path, std::string& err);

    void set(const std::string& category, const std::string& value,
             const std::string& replacement);

    // The mapped value, or `value` trimmed when nothing matches.
    std::string map_value(std::string_view property, std::string_view value) const;
    bool is_mappable(std::string_view property, std::string_view value) const;

    static std::optional<std::string> category_for_property(std::string_view property);

    const Table* table(const std::string& category) const;
    const std::vector<std::string>& categories() const { return order_; }
    size_t size() const;

private:
    explicit ValueMappings(bool with_defaults);

    std::map<std::string, Table> tables_;
    std::vector<std::string> order_;
};

} // namespace stylec::codegen
