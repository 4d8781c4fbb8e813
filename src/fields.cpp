#include "anndoc/fields.h"

#include <array>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace anndoc {

const char* const kNullSentinel = "_";
const char* const kMultiWordMarker = "MWT=Yes";

namespace {

const std::array<std::string, 14>& field_names() {
    static const std::array<std::string, 14> names = {
        "id", "text", "lemma", "upos", "xpos", "feats", "head",
        "deprel", "deps", "misc", "ner", "start_char", "end_char", "type"
    };
    return names;
}

// Python-style match: anchored at the start only, so "3-4.1" still counts as a range.
const std::regex& range_id_pattern() {
    static const std::regex pattern("^([0-9]+)-([0-9]+)");
    return pattern;
}

} // namespace

const std::string& field_name(Field field) {
    return field_names().at(static_cast<std::size_t>(field));
}

std::optional<Field> find_field(const std::string& name) {
    const auto& names = field_names();
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) {
            return static_cast<Field>(i);
        }
    }
    return std::nullopt;
}

Field parse_field(const std::string& name) {
    auto field = find_field(name);
    if (!field) {
        throw std::invalid_argument("Unknown field name: " + name);
    }
    return *field;
}

std::vector<Field> parse_fields(const std::vector<std::string>& names) {
    std::vector<Field> fields;
    fields.reserve(names.size());
    for (const auto& name : names) {
        fields.push_back(parse_field(name));
    }
    return fields;
}

bool is_null(const OptionalValue& value) {
    if (!value) {
        return true;
    }
    const auto* text = std::get_if<std::string>(&*value);
    return text && *text == kNullSentinel;
}

bool is_null(const std::optional<std::string>& value) {
    return !value || *value == kNullSentinel;
}

std::string value_to_string(const FieldValue& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return std::to_string(std::get<int>(value));
}

std::optional<int> parse_int(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t pos = 0;
    if (text[0] == '-' || text[0] == '+') {
        pos = 1;
    }
    if (pos == text.size()) {
        return std::nullopt;
    }
    for (std::size_t i = pos; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    try {
        return std::stoi(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int require_int(const std::string& text, const char* what) {
    auto value = parse_int(text);
    if (!value) {
        throw std::invalid_argument(std::string("Expected an integer ") + what + ", got '" + text + "'");
    }
    return *value;
}

FieldRecord::FieldRecord(std::initializer_list<std::pair<const Field, FieldValue>> init) {
    for (const auto& [field, value] : init) {
        set(field, value);
    }
}

void FieldRecord::set(Field field, const FieldValue& value) {
    values_[field] = value;
}

void FieldRecord::set(Field field, const OptionalValue& value) {
    if (!value) {
        values_.erase(field);
        return;
    }
    values_[field] = *value;
}

bool FieldRecord::has(Field field) const {
    auto it = values_.find(field);
    return it != values_.end() && !is_null(OptionalValue(it->second));
}

OptionalValue FieldRecord::get(Field field) const {
    auto it = values_.find(field);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> FieldRecord::get_string(Field field) const {
    auto it = values_.find(field);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return value_to_string(it->second);
}

std::optional<int> FieldRecord::get_int(Field field) const {
    auto it = values_.find(field);
    if (it == values_.end()) {
        return std::nullopt;
    }
    if (const auto* number = std::get_if<int>(&it->second)) {
        return *number;
    }
    if (std::get<std::string>(it->second) == kNullSentinel) {
        return std::nullopt;
    }
    return require_int(std::get<std::string>(it->second), ("for field " + field_name(field)).c_str());
}

std::vector<MiscItem> parse_misc(const std::string& misc) {
    std::vector<MiscItem> items;
    std::istringstream misc_stream(misc);
    std::string part;
    while (std::getline(misc_stream, part, '|')) {
        std::size_t eq = part.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        items.push_back({part.substr(0, eq), part.substr(eq + 1)});
    }
    return items;
}

bool has_multi_word_marker(const std::optional<std::string>& misc) {
    if (is_null(misc)) {
        return false;
    }
    std::istringstream misc_stream(*misc);
    std::string part;
    while (std::getline(misc_stream, part, '|')) {
        if (part == kMultiWordMarker) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> strip_multi_word_marker(const std::string& misc) {
    std::string filtered_misc;
    std::istringstream misc_stream(misc);
    std::string part;
    bool first = true;
    while (std::getline(misc_stream, part, '|')) {
        if (part == kMultiWordMarker) {
            continue;
        }
        if (!first) {
            filtered_misc += "|";
        }
        filtered_misc += part;
        first = false;
    }
    if (filtered_misc.empty() || filtered_misc == kNullSentinel) {
        return std::nullopt;
    }
    return filtered_misc;
}

std::optional<std::pair<int, int>> parse_range_id(const std::string& id) {
    std::smatch match;
    if (!std::regex_search(id, match, range_id_pattern())) {
        return std::nullopt;
    }
    auto start = parse_int(match[1].str());
    auto end = parse_int(match[2].str());
    if (!start || !end) {
        return std::nullopt;
    }
    return std::make_pair(*start, *end);
}

} // namespace anndoc
