#include "anndoc/sentence.h"

#include <sstream>
#include <stdexcept>

namespace anndoc {

namespace {

std::string trimmed(const std::string& value) {
    std::size_t end = value.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : value.substr(0, end + 1);
}

} // namespace

Sentence::Sentence(const std::vector<FieldRecord>& entries) {
    process_entries(entries);
}

const Word& Sentence::root() {
    static const Word root_word(FieldRecord{{Field::Id, "0"}, {Field::Text, "ROOT"}});
    return root_word;
}

void Sentence::process_entries(const std::vector<FieldRecord>& entries) {
    tokens_.clear();
    words_.clear();
    dependencies_.clear();
    dependencies_stale_ = false;

    // End of the most recent "start-end" range; words with ids up to it belong
    // to the last multi-word token.
    int range_end = -1;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        FieldRecord entry = entries[i];
        if (!entry.contains(Field::Id)) {
            entry.set(Field::Id, std::to_string(i + 1));
        }

        auto range = parse_range_id(*entry.get_string(Field::Id));
        if (range || has_multi_word_marker(entry.get_string(Field::Misc))) {
            if (range) {
                range_end = range->second;
            }
            tokens_.push_back(std::make_unique<Token>(entry));
            continue;
        }

        auto word = std::make_unique<Word>(entry);
        Word* raw_word = word.get();
        int index = require_int(word->id(), "for word id");
        if (index <= range_end && !tokens_.empty()) {
            tokens_.back()->add_word(std::move(word));
        } else {
            tokens_.push_back(std::make_unique<Token>(entry, std::move(word)));
        }
        words_.push_back(raw_word);
    }

    if (has_complete_dependencies()) {
        build_dependencies();
    }
}

void Sentence::rebuild() {
    process_entries(to_records());
}

bool Sentence::has_complete_dependencies() const {
    if (words_.empty()) {
        return false;
    }
    for (const Word* word : words_) {
        if (!word->head() || !word->deprel()) {
            return false;
        }
    }
    auto last_id = parse_int(words_.back()->id());
    return last_id && static_cast<std::size_t>(*last_id) == words_.size();
}

void Sentence::build_dependencies() {
    std::vector<Dependency> dependencies;
    dependencies.reserve(words_.size());
    for (const Word* word : words_) {
        if (!word->head() || !word->deprel()) {
            throw std::logic_error("Word " + word->id() + " has no head or deprel");
        }
        int head_id = *word->head();
        const Word* head = nullptr;
        if (head_id == 0) {
            head = &root();
        } else {
            if (head_id < 0 || static_cast<std::size_t>(head_id) > words_.size()) {
                throw std::logic_error("Head " + std::to_string(head_id) + " of word " + word->id() +
                                       " is outside the sentence");
            }
            // Ids are positions: the head must sit at index head-1.
            head = words_[head_id - 1];
            if (parse_int(head->id()) != head_id) {
                throw std::logic_error("Word at position " + std::to_string(head_id) + " has id " +
                                       head->id() + "; ids must be dense and ordered");
            }
        }
        dependencies.push_back({head, *word->deprel(), word});
    }
    dependencies_ = std::move(dependencies);
    dependencies_stale_ = false;
}

std::vector<FieldRecord> Sentence::to_records() const {
    std::vector<FieldRecord> records;
    for (const auto& token : tokens_) {
        auto token_records = token->to_records();
        records.insert(records.end(), token_records.begin(), token_records.end());
    }
    return records;
}

void Sentence::print_dependencies(std::ostream& out) const {
    for (const auto& edge : dependencies_) {
        out << "('" << edge.dependent->text() << "', '" << edge.head->id() << "', '" << edge.deprel << "')\n";
    }
}

std::string Sentence::dependencies_string() const {
    std::ostringstream out;
    print_dependencies(out);
    return trimmed(out.str());
}

void Sentence::print_tokens(std::ostream& out) const {
    for (const auto& token : tokens_) {
        out << token->pretty_print() << "\n";
    }
}

std::string Sentence::tokens_string() const {
    std::ostringstream out;
    print_tokens(out);
    return trimmed(out.str());
}

void Sentence::print_words(std::ostream& out) const {
    for (const Word* word : words_) {
        out << word->pretty_print() << "\n";
    }
}

std::string Sentence::words_string() const {
    std::ostringstream out;
    print_words(out);
    return trimmed(out.str());
}

} // namespace anndoc
