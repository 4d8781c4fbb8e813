#pragma once

#include "fields.h"
#include "token.h"
#include "word.h"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace anndoc {

// One edge of a dependency graph. `head` points to Sentence::root() for the root edge.
struct Dependency {
    const Word* head = nullptr;
    std::string deprel;
    const Word* dependent = nullptr;
};

class Sentence {
public:
    explicit Sentence(const std::vector<FieldRecord>& entries);

    Sentence(const Sentence&) = delete;
    Sentence& operator=(const Sentence&) = delete;
    Sentence(Sentence&&) = default;
    Sentence& operator=(Sentence&&) = default;

    // Shared synthetic governor of root edges (id "0", text "ROOT").
    static const Word& root();

    const std::vector<std::unique_ptr<Token>>& tokens() const { return tokens_; }
    const std::vector<Word*>& words() const { return words_; }
    const std::vector<Dependency>& dependencies() const { return dependencies_; }

    const std::optional<std::string>& text() const { return text_; }
    void set_text(const std::optional<std::string>& text) { text_ = text; }

    // Replaces all Token/Word/dependency state from the given entries.
    void process_entries(const std::vector<FieldRecord>& entries);
    // Re-derives the Word list and dependency graph from the current Tokens.
    void rebuild();

    // Builds one edge per Word. Throws std::logic_error when a head id does not
    // match the Word at position head-1.
    void build_dependencies();

    // Set when ids, heads or relations were written without a rebuild.
    bool dependencies_stale() const { return dependencies_stale_; }
    void mark_dependencies_stale() { dependencies_stale_ = true; }

    std::vector<FieldRecord> to_records() const;

    void print_dependencies(std::ostream& out) const;
    std::string dependencies_string() const;
    void print_tokens(std::ostream& out) const;
    std::string tokens_string() const;
    void print_words(std::ostream& out) const;
    std::string words_string() const;

private:
    bool has_complete_dependencies() const;

    std::vector<std::unique_ptr<Token>> tokens_;
    std::vector<Word*> words_;
    std::vector<Dependency> dependencies_;
    std::optional<std::string> text_;
    bool dependencies_stale_ = false;
};

} // namespace anndoc
