#include "anndoc/word.h"
#include "anndoc/token.h"

#include <functional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace anndoc {

namespace {

using MiscSetter = std::function<void(Word&, const std::string&)>;

// Misc keys that populate structured Word fields. Other keys stay in misc only.
const std::unordered_map<std::string, MiscSetter>& word_misc_setters() {
    static const std::unordered_map<std::string, MiscSetter> setters = {
        {"lemma", [](Word& w, const std::string& v) { w.set_lemma(v); }},
        {"upos", [](Word& w, const std::string& v) { w.set_upos(v); }},
        {"xpos", [](Word& w, const std::string& v) { w.set_xpos(v); }},
        {"feats", [](Word& w, const std::string& v) { w.set_feats(v); }},
        {"deprel", [](Word& w, const std::string& v) { w.set_deprel(v); }},
        {"deps", [](Word& w, const std::string& v) { w.set_deps(v); }},
        {"ner", [](Word& w, const std::string& v) { w.set_ner(v); }},
    };
    return setters;
}

std::optional<std::string> as_string(const OptionalValue& value) {
    if (!value) {
        return std::nullopt;
    }
    return value_to_string(*value);
}

} // namespace

Word::Word(const FieldRecord& entry) {
    auto id = entry.get_string(Field::Id);
    auto text = entry.get_string(Field::Text);
    if (!id || !text || id->empty() || text->empty()) {
        throw std::invalid_argument("id and text should be included for the word");
    }
    id_ = *id;
    text_ = *text;
    set_lemma(entry.get_string(Field::Lemma));
    set_upos(entry.get_string(Field::Upos));
    set_xpos(entry.get_string(Field::Xpos));
    set_feats(entry.get_string(Field::Feats));
    set_head(entry.get_int(Field::Head));
    set_deprel(entry.get_string(Field::Deprel));
    set_deps(entry.get_string(Field::Deps));
    set_misc(entry.get_string(Field::Misc));
    set_ner(entry.get_string(Field::Ner));

    if (misc_) {
        init_from_misc();
    }
}

void Word::assign(std::optional<std::string>& slot, const std::optional<std::string>& value) {
    slot = is_null(value) ? std::nullopt : value;
}

void Word::set_lemma(const std::optional<std::string>& lemma) {
    // The "_" placeholder word has "_" as its lemma.
    if (text_ == kNullSentinel && lemma) {
        lemma_ = lemma;
        return;
    }
    assign(lemma_, lemma);
}

void Word::init_from_misc() {
    const auto& setters = word_misc_setters();
    for (const auto& item : parse_misc(*misc_)) {
        auto it = setters.find(item.key);
        if (it != setters.end()) {
            it->second(*this, item.value);
        }
    }
}

OptionalValue Word::get(Field field) const {
    switch (field) {
        case Field::Id: return FieldValue(id_);
        case Field::Text: return FieldValue(text_);
        case Field::Lemma: return lemma_ ? OptionalValue(*lemma_) : std::nullopt;
        case Field::Upos: return upos_ ? OptionalValue(*upos_) : std::nullopt;
        case Field::Xpos: return xpos_ ? OptionalValue(*xpos_) : std::nullopt;
        case Field::Feats: return feats_ ? OptionalValue(*feats_) : std::nullopt;
        case Field::Head: return head_ ? OptionalValue(*head_) : std::nullopt;
        case Field::Deprel: return deprel_ ? OptionalValue(*deprel_) : std::nullopt;
        case Field::Deps: return deps_ ? OptionalValue(*deps_) : std::nullopt;
        case Field::Misc: return misc_ ? OptionalValue(*misc_) : std::nullopt;
        case Field::Ner: return ner_ ? OptionalValue(*ner_) : std::nullopt;
        case Field::StartChar:
            if (parent_ && parent_->start_char()) {
                return FieldValue(*parent_->start_char());
            }
            return std::nullopt;
        case Field::EndChar:
            if (parent_ && parent_->end_char()) {
                return FieldValue(*parent_->end_char());
            }
            return std::nullopt;
        case Field::Type:
            // Span-only field; a Word never carries it.
            return std::nullopt;
    }
    throw std::invalid_argument("Field '" + field_name(field) + "' is not available on a word");
}

void Word::set(Field field, const OptionalValue& value) {
    switch (field) {
        case Field::Id:
        case Field::Text: {
            if (is_null(value)) {
                throw std::invalid_argument("Word " + field_name(field) + " cannot be unset");
            }
            std::string text = value_to_string(*value);
            if (field == Field::Id) {
                id_ = text;
            } else {
                text_ = text;
            }
            return;
        }
        case Field::Lemma: set_lemma(as_string(value)); return;
        case Field::Upos: set_upos(as_string(value)); return;
        case Field::Xpos: set_xpos(as_string(value)); return;
        case Field::Feats: set_feats(as_string(value)); return;
        case Field::Head:
            if (is_null(value)) {
                head_.reset();
            } else if (const auto* number = std::get_if<int>(&*value)) {
                head_ = *number;
            } else {
                head_ = require_int(std::get<std::string>(*value), "for word head");
            }
            return;
        case Field::Deprel: set_deprel(as_string(value)); return;
        case Field::Deps: set_deps(as_string(value)); return;
        case Field::Misc: set_misc(as_string(value)); return;
        case Field::Ner: set_ner(as_string(value)); return;
        case Field::StartChar:
        case Field::EndChar:
        case Field::Type:
            break;
    }
    throw std::invalid_argument("Field '" + field_name(field) + "' cannot be set on a word");
}

FieldRecord Word::to_record() const {
    FieldRecord record;
    record.set(Field::Id, id_);
    record.set(Field::Text, text_);
    for (Field field : {Field::Lemma, Field::Upos, Field::Xpos, Field::Feats, Field::Head,
                        Field::Deprel, Field::Deps, Field::Misc, Field::Ner}) {
        record.set(field, get(field));
    }
    return record;
}

std::string Word::pretty_print() const {
    std::ostringstream out;
    out << "<Word ";
    bool first = true;
    for (Field field : {Field::Id, Field::Text, Field::Lemma, Field::Upos, Field::Xpos,
                        Field::Feats, Field::Head, Field::Deprel}) {
        auto value = get(field);
        if (!value) {
            continue;
        }
        if (!first) {
            out << ";";
        }
        out << field_name(field) << "=" << value_to_string(*value);
        first = false;
    }
    out << ">";
    return out.str();
}

} // namespace anndoc
