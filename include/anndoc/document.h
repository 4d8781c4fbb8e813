#pragma once

#include "fields.h"
#include "sentence.h"
#include "span.h"
#include "token.h"
#include "word.h"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace anndoc {

using SentenceEntries = std::vector<FieldRecord>;

// Lazy, restartable view over the Words or Tokens of all Sentences, in
// document order. Invalidated by anything that rebuilds the Sentences.
template <typename Item, typename Container>
class SentenceItemRange {
public:
    using Getter = const Container& (Sentence::*)() const;

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::remove_const_t<Item>;
        using difference_type = std::ptrdiff_t;
        using pointer = Item*;
        using reference = Item&;

        iterator(const std::vector<Sentence>* sentences, Getter getter, std::size_t sentence)
            : sentences_(sentences), getter_(getter), sentence_(sentence) {
            skip_exhausted();
        }

        reference operator*() const { return *(items()[pos_]); }
        pointer operator->() const { return &**this; }

        iterator& operator++() {
            ++pos_;
            skip_exhausted();
            return *this;
        }

        iterator operator++(int) {
            iterator copy = *this;
            ++*this;
            return copy;
        }

        bool operator==(const iterator& other) const {
            return sentence_ == other.sentence_ && pos_ == other.pos_;
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        const Container& items() const { return ((*sentences_)[sentence_].*getter_)(); }

        void skip_exhausted() {
            while (sentence_ < sentences_->size() && pos_ >= items().size()) {
                ++sentence_;
                pos_ = 0;
            }
        }

        const std::vector<Sentence>* sentences_;
        Getter getter_;
        std::size_t sentence_;
        std::size_t pos_ = 0;
    };

    SentenceItemRange(const std::vector<Sentence>* sentences, Getter getter)
        : sentences_(sentences), getter_(getter) {}

    iterator begin() const { return iterator(sentences_, getter_, 0); }
    iterator end() const { return iterator(sentences_, getter_, sentences_->size()); }

    std::size_t size() const {
        std::size_t count = 0;
        for (const auto& sentence : *sentences_) {
            count += (sentence.*getter_)().size();
        }
        return count;
    }

private:
    const std::vector<Sentence>* sentences_;
    Getter getter_;
};

// Source text of a multi-word token and, outside evaluation mode, its
// space-joined expansion.
struct MwtExpansion {
    std::string source;
    std::optional<std::string> expansion;
};

// Owns the Sentences of an annotated text. Spans in entities() point back to
// the Document, so it can be neither copied nor moved; factories hand out
// std::unique_ptr<Document>.
class Document {
public:
    using WordRange = SentenceItemRange<Word, std::vector<Word*>>;
    using ConstWordRange = SentenceItemRange<const Word, std::vector<Word*>>;
    using TokenRange = SentenceItemRange<Token, std::vector<std::unique_ptr<Token>>>;
    using ConstTokenRange = SentenceItemRange<const Token, std::vector<std::unique_ptr<Token>>>;

    explicit Document(const std::vector<SentenceEntries>& sentences,
                      std::optional<std::string> text = std::nullopt);

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;
    Document(Document&&) = delete;
    Document& operator=(Document&&) = delete;

    const std::optional<std::string>& text() const { return text_; }
    void set_text(const std::optional<std::string>& text) { text_ = text; }

    // Sentences are rebuilt only through the Document, which keeps the word
    // count and the entity list in step with them.
    const std::vector<Sentence>& sentences() const { return sentences_; }

    // Re-derives Sentence `index` from its current Tokens (e.g. after Words
    // were attached through iter_tokens()). Entities are cleared and marked
    // stale since their Words are gone. Throws std::out_of_range.
    void rebuild_sentence(std::size_t index);

    // Counted over the live Sentences.
    std::size_t num_words() const;

    const std::vector<Span>& entities() const { return entities_; }
    // Set when NER tags were written after the last build_ents().
    bool entities_stale() const { return entities_stale_; }

    // Values per Word in traversal order, after multi-word expansion.
    std::vector<OptionalValue> get(Field field) const;
    std::vector<std::vector<OptionalValue>> get(const std::vector<Field>& fields) const;
    std::vector<std::vector<OptionalValue>> get_sentences(Field field) const;
    std::vector<std::vector<std::vector<OptionalValue>>> get_sentences(const std::vector<Field>& fields) const;

    // Inverse of get(). Everything is validated before the first Word is
    // written: throws std::invalid_argument on an empty field list, a content
    // count different from num_words(), a row of the wrong width, or a value
    // a Word cannot hold.
    void set(Field field, const std::vector<OptionalValue>& contents);
    void set(const std::vector<Field>& fields, const std::vector<std::vector<OptionalValue>>& contents);

    // Expands every multi-word token with the next expansion, renumbers word
    // ids, drops dependency information and rebuilds all Sentences. Throws
    // std::invalid_argument, without touching the Document, when the number of
    // multi-word tokens differs from expansions.size() or an expansion is blank.
    void set_mwt_expansions(const std::vector<std::string>& expansions);
    std::vector<MwtExpansion> get_mwt_expansions(bool evaluation = false) const;

    // Decodes BIOES tags on Word::ner() into entity Spans; returns their count.
    std::size_t build_ents();

    WordRange iter_words() { return WordRange(&sentences_, &Sentence::words); }
    ConstWordRange iter_words() const { return ConstWordRange(&sentences_, &Sentence::words); }
    TokenRange iter_tokens() { return TokenRange(&sentences_, &Sentence::tokens); }
    ConstTokenRange iter_tokens() const { return ConstTokenRange(&sentences_, &Sentence::tokens); }

    std::vector<SentenceEntries> to_records() const;

private:
    void process_sentences(const std::vector<SentenceEntries>& sentences);
    void check_contents_size(std::size_t size) const;

    std::vector<Sentence> sentences_;
    std::optional<std::string> text_;
    std::vector<Span> entities_;
    bool entities_stale_ = false;
};

} // namespace anndoc
