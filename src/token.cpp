#include "anndoc/token.h"

#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace anndoc {

const std::unordered_map<std::string, std::optional<int> Token::*>& Token::misc_attributes() {
    static const std::unordered_map<std::string, std::optional<int> Token::*> attributes = {
        {"start_char", &Token::start_char_},
        {"end_char", &Token::end_char_},
    };
    return attributes;
}

Token::Token(const FieldRecord& entry) {
    auto id = entry.get_string(Field::Id);
    auto text = entry.get_string(Field::Text);
    if (!id || !text || id->empty() || text->empty()) {
        throw std::invalid_argument("id and text should be included for the token");
    }
    id_ = *id;
    text_ = *text;
    set_misc(entry.get_string(Field::Misc));
    if (misc_) {
        init_from_misc();
    }
}

Token::Token(const FieldRecord& entry, std::unique_ptr<Word> word)
    : Token(entry) {
    add_word(std::move(word));
}

void Token::set_misc(const std::optional<std::string>& misc) {
    misc_ = is_null(misc) ? std::nullopt : misc;
}

void Token::init_from_misc() {
    const auto& attributes = misc_attributes();
    for (const auto& item : parse_misc(*misc_)) {
        auto it = attributes.find(item.key);
        if (it != attributes.end()) {
            this->*(it->second) = require_int(item.value, ("for " + item.key).c_str());
        }
    }
}

void Token::add_word(std::unique_ptr<Word> word) {
    if (!word) {
        throw std::invalid_argument("Cannot attach a null word to token " + id_);
    }
    if (word->parent_ != nullptr && word->parent_ != this) {
        throw std::logic_error("Word " + word->id() + " already belongs to another token");
    }
    word->parent_ = this;
    words_.push_back(std::move(word));
}

void Token::set_words(std::vector<std::unique_ptr<Word>> words) {
    words_.clear();
    for (auto& word : words) {
        add_word(std::move(word));
    }
}

bool Token::has_multi_word_mark() const {
    return parse_range_id(id_).has_value() || has_multi_word_marker(misc_);
}

std::vector<FieldRecord> Token::to_records() const {
    std::vector<FieldRecord> records;
    if (is_multi_word()) {
        FieldRecord token_entry;
        token_entry.set(Field::Id, id_);
        token_entry.set(Field::Text, text_);
        if (misc_) {
            token_entry.set(Field::Misc, *misc_);
        }
        records.push_back(std::move(token_entry));
    }
    for (const auto& word : words_) {
        records.push_back(word->to_record());
    }
    return records;
}

std::string Token::pretty_print() const {
    std::ostringstream out;
    out << "<Token id=" << id_ << ";words=[";
    for (std::size_t i = 0; i < words_.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << words_[i]->pretty_print();
    }
    out << "]>";
    return out.str();
}

} // namespace anndoc
