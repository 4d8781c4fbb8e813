#pragma once

#include "fields.h"
#include "word.h"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace anndoc {

// A contiguous unit of raw text. Multi-word tokens own more than one Word;
// a tokenizer shell may own none until its expansion is set.
class Token {
public:
    // Throws std::invalid_argument if id or text is missing.
    explicit Token(const FieldRecord& entry);
    Token(const FieldRecord& entry, std::unique_ptr<Word> word);

    Token(const Token&) = delete;
    Token& operator=(const Token&) = delete;

    const std::string& id() const { return id_; }
    void set_id(const std::string& id) { id_ = id; }

    const std::string& text() const { return text_; }
    void set_text(const std::string& text) { text_ = text; }

    const std::optional<std::string>& misc() const { return misc_; }
    // Stores misc only; start_char/end_char are read from misc at construction.
    void set_misc(const std::optional<std::string>& misc);

    std::optional<int> start_char() const { return start_char_; }
    std::optional<int> end_char() const { return end_char_; }

    const std::vector<std::unique_ptr<Word>>& words() const { return words_; }
    // Takes ownership and sets each Word's parent. Throws std::logic_error if a
    // Word already belongs to another Token.
    void add_word(std::unique_ptr<Word> word);
    void set_words(std::vector<std::unique_ptr<Word>> words);

    bool is_multi_word() const { return words_.size() != 1; }
    // True when the id is a range or misc carries the MWT=Yes marker.
    bool has_multi_word_mark() const;

    // The token entry (only when it does not own exactly one Word) followed by
    // one entry per Word.
    std::vector<FieldRecord> to_records() const;
    std::string pretty_print() const;

private:
    // Misc keys that materialize as Token attributes; other keys stay in misc only.
    static const std::unordered_map<std::string, std::optional<int> Token::*>& misc_attributes();
    void init_from_misc();

    std::string id_;
    std::string text_;
    std::optional<std::string> misc_;
    std::optional<int> start_char_;
    std::optional<int> end_char_;
    std::vector<std::unique_ptr<Word>> words_;
};

} // namespace anndoc
