#include "anndoc/span.h"
#include "anndoc/document.h"
#include "anndoc/token.h"
#include "anndoc/unicode_utils.h"

#include <stdexcept>

namespace anndoc {

namespace {

const Document* require_doc(const Document* doc) {
    if (!doc) {
        throw std::invalid_argument("A parent document must be provided to construct a span");
    }
    return doc;
}

} // namespace

Span::Span(const FieldRecord& entry, const Document* doc)
    : doc_(require_doc(doc)) {
    text_ = entry.has(Field::Text) ? entry.get_string(Field::Text) : std::nullopt;
    type_ = entry.has(Field::Type) ? entry.get_string(Field::Type) : std::nullopt;
    start_char_ = entry.get_int(Field::StartChar);
    end_char_ = entry.get_int(Field::EndChar);
}

Span::Span(std::vector<const Word*> words, std::string type, const Document* doc)
    : doc_(require_doc(doc)), words_(std::move(words)), type_(std::move(type)) {
    if (words_.empty()) {
        throw std::invalid_argument("Words of a span cannot be an empty list");
    }
    const Token* first = words_.front()->parent();
    const Token* last = words_.back()->parent();
    if (!first || !last) {
        throw std::logic_error("Span words must be attached to tokens");
    }
    start_char_ = first->start_char();
    end_char_ = last->end_char();
    if (start_char_ && end_char_ && doc_->text()) {
        text_ = unicode::substr_chars(*doc_->text(), *start_char_, *end_char_);
    }
}

FieldRecord Span::to_record() const {
    FieldRecord record;
    if (text_) {
        record.set(Field::Text, *text_);
    }
    if (type_) {
        record.set(Field::Type, *type_);
    }
    if (start_char_) {
        record.set(Field::StartChar, *start_char_);
    }
    if (end_char_) {
        record.set(Field::EndChar, *end_char_);
    }
    return record;
}

} // namespace anndoc
