#include <stylec/codegen/value_mappings.h>
#include <stylec/core/strings.h>
#include <json/json.h>
#include <fstream>
#include <memory>
#include <sstream>
#include <tuple>

namespace stylec::codegen {

namespace {

struct DefaultTable {
    const char* category;
    std::vector<std::pair<const char*, const char*>> entries;
};

const std::vector<DefaultTable>& default_tables() {
    static const std::vector<DefaultTable> tables = {
        {"colors", {
            {"#007bff", "var(--color-primary)"},
            {"#0056b3", "var(--color-primary-hover)"},
            {"#004085", "var(--color-primary-active)"},
            {"#545b62", "var(--color-secondary-hover)"},
            {"#4e555b", "var(--color-secondary-active)"},
            {"#28a745", "var(--color-success)"},
            {"#1e7e34", "var(--color-success-hover)"},
            {"#dc3545", "var(--color-error)"},
            {"#c82333", "var(--color-error-hover)"},
            {"#ffc107", "var(--color-warning)"},
            {"#e0a800", "var(--color-warning-hover)"},
            {"#212529", "var(--color-text-primary)"},
            {"#6c757d", "var(--color-text-secondary)"},
            {"#ffffff", "var(--color-background)"},
            {"#f8f9fa", "var(--color-surface)"},
            {"#e9ecef", "var(--color-surface-hover)"},
            {"#dee2e6", "var(--color-border)"},
            {"#adb5bd", "var(--color-border-hover)"},
            {"white", "var(--color-background)"},
            {"black", "var(--color-text-primary)"},
            {"transparent", "transparent"},
        }},
        {"spacing", {
            {"2px", "var(--spacing-xs)"},
            {"4px", "var(--spacing-xs)"},
            {"8px", "var(--spacing-sm)"},
            {"12px", "var(--spacing-md)"},
            {"16px", "var(--spacing-md)"},
            {"20px", "var(--spacing-lg)"},
            {"24px", "var(--spacing-lg)"},
            {"32px", "var(--spacing-xl)"},
            {"40px", "var(--spacing-xxl)"},
            {"48px", "var(--spacing-xxl)"},
            {"0.125rem", "var(--spacing-xs)"},
            {"0.25rem", "var(--spacing-xs)"},
            {"0.5rem", "var(--spacing-sm)"},
            {"0.75rem", "var(--spacing-md)"},
            {"1rem", "var(--spacing-md)"},
            {"1.25rem", "var(--spacing-lg)"},
            {"1.5rem", "var(--spacing-lg)"},
            {"2rem", "var(--spacing-xl)"},
            {"2.5rem", "var(--spacing-xxl)"},
            {"3rem", "var(--spacing-xxl)"},
        }},
        {"border_radius", {
            {"2px", "var(--border-radius-sm)"},
            {"4px", "var(--border-radius-sm)"},
            {"6px", "var(--border-radius-md)"},
            {"8px", "var(--border-radius-md)"},
            {"12px", "var(--border-radius-lg)"},
            {"16px", "var(--border-radius-lg)"},
            {"50%", "50%"},
            {"9999px", "var(--border-radius-full)"},
            {"0.125rem", "var(--border-radius-sm)"},
            {"0.25rem", "var(--border-radius-sm)"},
            {"0.375rem", "var(--border-radius-md)"},
            {"0.5rem", "var(--border-radius-md)"},
            {"0.75rem", "var(--border-radius-lg)"},
            {"1rem", "var(--border-radius-lg)"},
        }},
        {"font_sizes", {
            {"12px", "var(--font-size-xs)"},
            {"14px", "var(--font-size-sm)"},
            {"16px", "var(--font-size-md)"},
            {"18px", "var(--font-size-lg)"},
            {"20px", "var(--font-size-xl)"},
            {"24px", "var(--font-size-xxl)"},
            {"0.75rem", "var(--font-size-xs)"},
            {"0.875rem", "var(--font-size-sm)"},
            {"1rem", "var(--font-size-md)"},
            {"1.125rem", "var(--font-size-lg)"},
            {"1.25rem", "var(--font-size-xl)"},
            {"1.5rem", "var(--font-size-xxl)"},
        }},
        {"font_weights", {
            {"300", "var(--font-weight-light)"},
            {"400", "var(--font-weight-normal)"},
            {"500", "var(--font-weight-medium)"},
            {"600", "var(--font-weight-semibold)"},
            {"700", "var(--font-weight-bold)"},
            {"800", "var(--font-weight-extrabold)"},
            {"light", "var(--font-weight-light)"},
            {"normal", "var(--font-weight-normal)"},
            {"medium", "var(--font-weight-medium)"},
            {"semibold", "var(--font-weight-semibold)"},
            {"bold", "var(--font-weight-bold)"},
        }},
        {"shadows", {
            {"0 1px 3px rgba(0,0,0,0.1)", "var(--shadow-sm)"},
            {"0 4px 6px rgba(0,0,0,0.1)", "var(--shadow-md)"},
            {"0 10px 15px rgba(0,0,0,0.1)", "var(--shadow-lg)"},
            {"0 20px 25px rgba(0,0,0,0.1)", "var(--shadow-xl)"},
            {"none", "none"},
        }},
        {"transitions", {
            {"0.15s", "var(--transition-fast)"},
            {"0.2s", "var(--transition-fast)"},
            {"0.3s", "var(--transition-normal)"},
            {"0.5s", "var(--transition-slow)"},
            {"150ms", "var(--transition-fast)"},
            {"200ms", "var(--transition-fast)"},
            {"300ms", "var(--transition-normal)"},
            {"500ms", "var(--transition-slow)"},
        }},
        {"breakpoints", {
            {"576px", "var(--breakpoint-sm)"},
            {"768px", "var(--breakpoint-md)"},
            {"992px", "var(--breakpoint-lg)"},
            {"1200px", "var(--breakpoint-xl)"},
            {"1400px", "var(--breakpoint-xxl)"},
        }},
    };
    return tables;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

} // namespace

ValueMappings::ValueMappings() : ValueMappings(true) {}

ValueMappings::ValueMappings(bool with_defaults) {
    if (!with_defaults) return;
    for (const auto& table : default_tables()) {
        for (const auto& [value, replacement] : table.entries) {
            set(table.category, value, replacement);
        }
    }
}

ValueMappings ValueMappings::empty() {
    return ValueMappings(false);
}

void ValueMappings::set(const std::string& category, const std::string& value,
                        const std::string& replacement) {
    auto it = tables_.find(category);
    if (it == tables_.end()) {
        order_.push_back(category);
        it = tables_.emplace(category, Table{}).first;
    }
    it->second[value] = replacement;
}

bool ValueMappings::merge_json(std::string_view json_text, std::string& err) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string parse_errors;
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root,
                       &parse_errors)) {
        err = "invalid JSON: " + core::trim(parse_errors);
        return false;
    }
    if (!root.isObject()) {
        err = "mappings must be a JSON object of categories";
        return false;
    }

    // Validate everything before touching the tables
    std::vector<std::tuple<std::string, std::string, std::string>> entries;
    for (const auto& category : root.getMemberNames()) {
        const Json::Value& values = root[category];
        if (!values.isObject()) {
            err = "category '" + category + "' must be an object";
            return false;
        }
        for (const auto& value : values.getMemberNames()) {
            const Json::Value& replacement = values[value];
            if (!replacement.isString()) {
                err = "mapping '" + category + "." + value + "' must be a string";
                return false;
            }
            entries.emplace_back(category, value, replacement.asString());
        }
    }

    for (const auto& [category, value, replacement] : entries) {
        set(category, value, replacement);
    }
    return true;
}

bool ValueMappings::load_file(const std::string& path, std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        err = "Failed to open mappings file: " + path;
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (!merge_json(ss.str(), err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

std::optional<std::string> ValueMappings::category_for_property(std::string_view property) {
    const std::string prop = core::to_lower(property);
    if (contains(prop, "color") || contains(prop, "background")) return "colors";
    if (contains(prop, "padding") || contains(prop, "margin") || contains(prop, "gap") ||
        contains(prop, "spacing")) {
        return "spacing";
    }
    if (contains(prop, "border-radius")) return "border_radius";
    if (contains(prop, "font-size")) return "font_sizes";
    if (contains(prop, "font-weight")) return "font_weights";
    if (contains(prop, "shadow")) return "shadows";
    if (contains(prop, "transition")) return "transitions";
    if (contains(prop, "width")) return "breakpoints";
    return std::nullopt;
}

std::string ValueMappings::map_value(std::string_view property, std::string_view value) const {
    const std::string key = core::trim(value);

    if (auto category = category_for_property(property)) {
        auto it = tables_.find(*category);
        if (it != tables_.end()) {
            auto hit = it->second.find(key);
            return hit != it->second.end() ? hit->second : key;
        }
    }

    for (const auto& category : order_) {
        const auto& table = tables_.at(category);
        auto hit = table.find(key);
        if (hit != table.end()) return hit->second;
    }
    return key;
}

bool ValueMappings::is_mappable(std::string_view property, std::string_view value) const {
    return map_value(property, value) != core::trim(value);
}

const ValueMappings::Table* ValueMappings::table(const std::string& category) const {
    auto it = tables_.find(category);
    return it == tables_.end() ? nullptr : &it->second;
}

size_t ValueMappings::size() const {
    size_t total = 0;
    for (const auto& [name, table] : tables_) {
        total += table.size();
    }
    return total;
}

} // namespace stylec::codegen
