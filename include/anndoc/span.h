#pragma once

#include "fields.h"
#include "word.h"

#include <optional>
#include <string>
#include <vector>

namespace anndoc {

class Document;

// A typed run of Words inside a Document, e.g. an entity mention. The Words
// and the Document are borrowed and must outlive the Span.
class Span {
public:
    // Trusts text, type and the character range of the entry as given.
    Span(const FieldRecord& entry, const Document* doc);
    // Derives the character range from the parent Tokens of the first and last
    // Word and slices the Document text by it.
    Span(std::vector<const Word*> words, std::string type, const Document* doc);

    const Document* doc() const { return doc_; }
    const std::vector<const Word*>& words() const { return words_; }

    const std::optional<std::string>& text() const { return text_; }
    void set_text(const std::optional<std::string>& text) { text_ = text; }

    const std::optional<std::string>& type() const { return type_; }
    void set_type(const std::optional<std::string>& type) { type_ = type; }

    std::optional<int> start_char() const { return start_char_; }
    void set_start_char(std::optional<int> start_char) { start_char_ = start_char; }

    std::optional<int> end_char() const { return end_char_; }
    void set_end_char(std::optional<int> end_char) { end_char_ = end_char; }

    FieldRecord to_record() const;

private:
    const Document* doc_ = nullptr;
    std::vector<const Word*> words_;
    std::optional<std::string> text_;
    std::optional<std::string> type_;
    std::optional<int> start_char_;
    std::optional<int> end_char_;
};

} // namespace anndoc
