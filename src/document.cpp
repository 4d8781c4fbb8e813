#include "anndoc/document.h"
#include "anndoc/unicode_utils.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace anndoc {

namespace {

bool is_word_field(Field field) {
    switch (field) {
        case Field::StartChar:
        case Field::EndChar:
        case Field::Type:
            return false;
        default:
            return true;
    }
}

// Rejects values Word::set would throw on, so set() never stops halfway.
void check_word_value(Field field, const OptionalValue& value) {
    if (!is_word_field(field)) {
        throw std::invalid_argument("Field '" + field_name(field) + "' cannot be set on a word");
    }
    if ((field == Field::Id || field == Field::Text) && is_null(value)) {
        throw std::invalid_argument("Word " + field_name(field) + " cannot be unset");
    }
    if (field == Field::Head && !is_null(value)) {
        if (const auto* text = std::get_if<std::string>(&*value)) {
            require_int(*text, "for word head");
        }
    }
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream stream(text);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

bool has_prefix(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

} // namespace

Document::Document(const std::vector<SentenceEntries>& sentences, std::optional<std::string> text)
    : text_(std::move(text)) {
    process_sentences(sentences);
}

void Document::process_sentences(const std::vector<SentenceEntries>& sentences) {
    sentences_.clear();
    sentences_.reserve(sentences.size());
    for (const auto& entries : sentences) {
        sentences_.emplace_back(entries);
        Sentence& sentence = sentences_.back();

        if (!text_ || sentence.tokens().empty()) {
            continue;
        }
        auto begin = sentence.tokens().front()->start_char();
        auto end = sentence.tokens().back()->end_char();
        if (begin && end) {
            sentence.set_text(unicode::substr_chars(*text_, *begin, *end));
        }
    }
}

std::size_t Document::num_words() const {
    std::size_t count = 0;
    for (const auto& sentence : sentences_) {
        count += sentence.words().size();
    }
    return count;
}

void Document::rebuild_sentence(std::size_t index) {
    sentences_.at(index).rebuild();
    entities_.clear();
    entities_stale_ = true;
}

std::vector<OptionalValue> Document::get(Field field) const {
    std::vector<OptionalValue> results;
    results.reserve(num_words());
    for (const auto& sentence : sentences_) {
        for (const Word* word : sentence.words()) {
            results.push_back(word->get(field));
        }
    }
    return results;
}

std::vector<std::vector<OptionalValue>> Document::get(const std::vector<Field>& fields) const {
    if (fields.empty()) {
        throw std::invalid_argument("Must have at least one field");
    }
    std::vector<std::vector<OptionalValue>> results;
    results.reserve(num_words());
    for (const auto& sentence : sentences_) {
        for (const Word* word : sentence.words()) {
            std::vector<OptionalValue> row;
            row.reserve(fields.size());
            for (Field field : fields) {
                row.push_back(word->get(field));
            }
            results.push_back(std::move(row));
        }
    }
    return results;
}

std::vector<std::vector<OptionalValue>> Document::get_sentences(Field field) const {
    std::vector<std::vector<OptionalValue>> results;
    results.reserve(sentences_.size());
    for (const auto& sentence : sentences_) {
        std::vector<OptionalValue> cursent;
        cursent.reserve(sentence.words().size());
        for (const Word* word : sentence.words()) {
            cursent.push_back(word->get(field));
        }
        results.push_back(std::move(cursent));
    }
    return results;
}

std::vector<std::vector<std::vector<OptionalValue>>> Document::get_sentences(const std::vector<Field>& fields) const {
    if (fields.empty()) {
        throw std::invalid_argument("Must have at least one field");
    }
    std::vector<std::vector<std::vector<OptionalValue>>> results;
    results.reserve(sentences_.size());
    for (const auto& sentence : sentences_) {
        std::vector<std::vector<OptionalValue>> cursent;
        for (const Word* word : sentence.words()) {
            std::vector<OptionalValue> row;
            for (Field field : fields) {
                row.push_back(word->get(field));
            }
            cursent.push_back(std::move(row));
        }
        results.push_back(std::move(cursent));
    }
    return results;
}

void Document::check_contents_size(std::size_t size) const {
    std::size_t words = num_words();
    if (size != words) {
        throw std::invalid_argument("Contents must have the same number of entries as the document has words (" +
                                    std::to_string(size) + " vs " + std::to_string(words) + ")");
    }
}

void Document::set(Field field, const std::vector<OptionalValue>& contents) {
    std::vector<std::vector<OptionalValue>> rows;
    rows.reserve(contents.size());
    for (const auto& value : contents) {
        rows.push_back({value});
    }
    set(std::vector<Field>{field}, rows);
}

void Document::set(const std::vector<Field>& fields, const std::vector<std::vector<OptionalValue>>& contents) {
    if (fields.empty()) {
        throw std::invalid_argument("Must have at least one field");
    }
    check_contents_size(contents.size());
    for (const auto& row : contents) {
        if (row.size() != fields.size()) {
            throw std::invalid_argument("Each row must hold one value per field");
        }
        for (std::size_t i = 0; i < fields.size(); ++i) {
            check_word_value(fields[i], row[i]);
        }
    }

    std::size_t cidx = 0;
    for (auto& sentence : sentences_) {
        for (Word* word : sentence.words()) {
            const auto& row = contents[cidx++];
            for (std::size_t i = 0; i < fields.size(); ++i) {
                word->set(fields[i], row[i]);
            }
        }
    }

    auto touches = [&fields](Field field) {
        return std::find(fields.begin(), fields.end(), field) != fields.end();
    };
    if (touches(Field::Id) || touches(Field::Head) || touches(Field::Deprel)) {
        for (auto& sentence : sentences_) {
            sentence.mark_dependencies_stale();
        }
    }
    if (touches(Field::Ner)) {
        entities_stale_ = true;
    }
}

void Document::set_mwt_expansions(const std::vector<std::string>& expansions) {
    std::size_t expected = 0;
    for (const auto& token : iter_tokens()) {
        if (token.has_multi_word_mark()) {
            ++expected;
        }
    }
    if (expected != expansions.size()) {
        throw std::invalid_argument("Got " + std::to_string(expansions.size()) + " expansions for " +
                                    std::to_string(expected) + " multi-word tokens");
    }
    std::vector<std::vector<std::string>> expanded_words;
    expanded_words.reserve(expansions.size());
    for (const auto& expansion : expansions) {
        expanded_words.push_back(split_whitespace(expansion));
        if (expanded_words.back().empty()) {
            throw std::invalid_argument("Empty expansion for multi-word token " + std::to_string(expanded_words.size()));
        }
    }

    std::size_t idx_e = 0;
    for (auto& sentence : sentences_) {
        int idx_w = 0;
        for (const auto& token : sentence.tokens()) {
            ++idx_w;
            if (!token->has_multi_word_mark()) {
                for (const auto& word : token->words()) {
                    word->set_id(std::to_string(idx_w));
                    // Renumbering invalidates dependency information.
                    word->set_head(std::nullopt);
                    word->set_deprel(std::nullopt);
                }
                continue;
            }

            const auto& parts = expanded_words[idx_e++];
            int idx_w_end = idx_w + static_cast<int>(parts.size()) - 1;
            if (token->misc()) {
                token->set_misc(strip_multi_word_marker(*token->misc()));
            }
            token->set_id(std::to_string(idx_w) + "-" + std::to_string(idx_w_end));

            std::vector<std::unique_ptr<Word>> words;
            words.reserve(parts.size());
            for (std::size_t i = 0; i < parts.size(); ++i) {
                words.push_back(std::make_unique<Word>(
                    FieldRecord{{Field::Id, std::to_string(idx_w + static_cast<int>(i))}, {Field::Text, parts[i]}}));
            }
            token->set_words(std::move(words));
            idx_w = idx_w_end;
        }
    }

    // Rebuild Sentences, their Word lists and dependency graphs.
    process_sentences(to_records());
    entities_.clear();
    entities_stale_ = false;
}

std::vector<MwtExpansion> Document::get_mwt_expansions(bool evaluation) const {
    std::vector<MwtExpansion> expansions;
    for (const auto& token : iter_tokens()) {
        if (!token.has_multi_word_mark()) {
            continue;
        }
        MwtExpansion expansion;
        expansion.source = token.text();
        if (!evaluation) {
            std::string joined;
            for (const auto& word : token.words()) {
                if (!joined.empty()) {
                    joined += " ";
                }
                joined += word->text();
            }
            expansion.expansion = joined;
        }
        expansions.push_back(std::move(expansion));
    }
    return expansions;
}

std::size_t Document::build_ents() {
    std::vector<Span> entities;
    std::vector<const Word*> ent_words;
    std::string cur_type;

    auto flush = [&]() {
        if (!ent_words.empty()) {
            entities.emplace_back(ent_words, cur_type, this);
        }
        ent_words.clear();
    };

    for (const auto& sentence : sentences_) {
        for (const Word* word : sentence.words()) {
            const auto& ner = word->ner();
            if (!ner || *ner == "O") {
                flush();
            } else if (has_prefix(*ner, "B-")) {
                flush();
                ent_words.push_back(word);
                cur_type = ner->substr(2);
            } else if (has_prefix(*ner, "I-")) {
                ent_words.push_back(word);
                cur_type = ner->substr(2);
            } else if (has_prefix(*ner, "E-")) {
                ent_words.push_back(word);
                cur_type = ner->substr(2);
                flush();
            } else if (has_prefix(*ner, "S-")) {
                flush();
                ent_words.push_back(word);
                cur_type = ner->substr(2);
                flush();
            }
            // Any other tag is skipped and leaves the open entity as it is.
        }
        // Entities never cross a sentence boundary.
        flush();
    }

    entities_ = std::move(entities);
    entities_stale_ = false;
    return entities_.size();
}

std::vector<SentenceEntries> Document::to_records() const {
    std::vector<SentenceEntries> records;
    records.reserve(sentences_.size());
    for (const auto& sentence : sentences_) {
        records.push_back(sentence.to_records());
    }
    return records;
}

} // namespace anndoc
