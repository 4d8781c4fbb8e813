#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace anndoc {

// Recognized field names, in serialization order.
enum class Field {
    Id,
    Text,
    Lemma,
    Upos,
    Xpos,
    Feats,
    Head,
    Deprel,
    Deps,
    Misc,
    Ner,
    StartChar,
    EndChar,
    Type
};

extern const char* const kNullSentinel;      // "_"
extern const char* const kMultiWordMarker;   // "MWT=Yes"

const std::string& field_name(Field field);
std::optional<Field> find_field(const std::string& name);
// Throws std::invalid_argument for unknown names.
Field parse_field(const std::string& name);
std::vector<Field> parse_fields(const std::vector<std::string>& names);

using FieldValue = std::variant<std::string, int>;
using OptionalValue = std::optional<FieldValue>;

bool is_null(const OptionalValue& value);
bool is_null(const std::optional<std::string>& value);
std::string value_to_string(const FieldValue& value);

// Strict integer parse: the whole string must be an optionally signed number.
std::optional<int> parse_int(const std::string& text);
// Same as parse_int but throws std::invalid_argument naming `what`.
int require_int(const std::string& text, const char* what);

// Uniform seed/serialization shape shared by every unit. Values are kept as
// given; has() treats "_" the same as absence, and the typed units decide
// what a "_" means for each field.
class FieldRecord {
public:
    using Storage = std::map<Field, FieldValue>;

    FieldRecord() = default;
    FieldRecord(std::initializer_list<std::pair<const Field, FieldValue>> init);

    void set(Field field, const FieldValue& value);
    void set(Field field, const OptionalValue& value);
    void set(Field field, const std::string& value) { set(field, FieldValue(value)); }
    void set(Field field, const char* value) { set(field, FieldValue(std::string(value))); }
    void set(Field field, int value) { set(field, FieldValue(value)); }
    void erase(Field field) { values_.erase(field); }

    // False for absent fields and for the null sentinel.
    bool has(Field field) const;
    bool contains(Field field) const { return values_.count(field) > 0; }
    OptionalValue get(Field field) const;
    // Integers are rendered in decimal.
    std::optional<std::string> get_string(Field field) const;
    // "_" reads as unset; other strings are parsed strictly and throw
    // std::invalid_argument if not numeric.
    std::optional<int> get_int(Field field) const;

    bool empty() const { return values_.empty(); }
    std::size_t size() const { return values_.size(); }
    Storage::const_iterator begin() const { return values_.begin(); }
    Storage::const_iterator end() const { return values_.end(); }

    bool operator==(const FieldRecord& other) const { return values_ == other.values_; }
    bool operator!=(const FieldRecord& other) const { return !(*this == other); }

private:
    Storage values_;
};

// One `key=value` item of a misc string.
struct MiscItem {
    std::string key;
    std::string value;
};

// Splits a misc string on '|' and keeps the items that contain '='.
std::vector<MiscItem> parse_misc(const std::string& misc);
bool has_multi_word_marker(const std::optional<std::string>& misc);
// Returns the misc string without the marker item, or nullopt when nothing is left.
std::optional<std::string> strip_multi_word_marker(const std::string& misc);

// Matches ids of the form "<int>-<int>" and returns the range bounds.
std::optional<std::pair<int, int>> parse_range_id(const std::string& id);

} // namespace anndoc
