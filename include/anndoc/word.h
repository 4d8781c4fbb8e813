#pragma once

#include "fields.h"

#include <optional>
#include <string>

namespace anndoc {

class Token;

// Smallest annotated syntactic unit. A Word is owned by exactly one Token,
// which sets the parent back-reference when the Word is attached.
class Word {
public:
    // Throws std::invalid_argument if id or text is missing.
    explicit Word(const FieldRecord& entry);

    Word(const Word&) = delete;
    Word& operator=(const Word&) = delete;

    const std::string& id() const { return id_; }
    void set_id(const std::string& id) { id_ = id; }

    const std::string& text() const { return text_; }
    void set_text(const std::string& text) { text_ = text; }

    const std::optional<std::string>& lemma() const { return lemma_; }
    void set_lemma(const std::optional<std::string>& lemma);

    const std::optional<std::string>& upos() const { return upos_; }
    void set_upos(const std::optional<std::string>& upos) { assign(upos_, upos); }
    const std::optional<std::string>& pos() const { return upos_; }
    void set_pos(const std::optional<std::string>& pos) { assign(upos_, pos); }

    const std::optional<std::string>& xpos() const { return xpos_; }
    void set_xpos(const std::optional<std::string>& xpos) { assign(xpos_, xpos); }

    const std::optional<std::string>& feats() const { return feats_; }
    void set_feats(const std::optional<std::string>& feats) { assign(feats_, feats); }

    std::optional<int> head() const { return head_; }
    void set_head(std::optional<int> head) { head_ = head; }

    const std::optional<std::string>& deprel() const { return deprel_; }
    void set_deprel(const std::optional<std::string>& deprel) { assign(deprel_, deprel); }

    const std::optional<std::string>& deps() const { return deps_; }
    void set_deps(const std::optional<std::string>& deps) { assign(deps_, deps); }

    const std::optional<std::string>& misc() const { return misc_; }
    void set_misc(const std::optional<std::string>& misc) { assign(misc_, misc); }

    const std::optional<std::string>& ner() const { return ner_; }
    void set_ner(const std::optional<std::string>& ner) { assign(ner_, ner); }

    Token* parent() const { return parent_; }

    // Field projection used by Document::get/set. start_char and end_char
    // come from the parent Token and are read-only.
    OptionalValue get(Field field) const;
    void set(Field field, const OptionalValue& value);

    FieldRecord to_record() const;
    std::string pretty_print() const;

private:
    friend class Token;

    static void assign(std::optional<std::string>& slot, const std::optional<std::string>& value);
    void init_from_misc();

    std::string id_;
    std::string text_;
    std::optional<std::string> lemma_;
    std::optional<std::string> upos_;
    std::optional<std::string> xpos_;
    std::optional<std::string> feats_;
    std::optional<int> head_;
    std::optional<std::string> deprel_;
    std::optional<std::string> deps_;
    std::optional<std::string> misc_;
    std::optional<std::string> ner_;
    Token* parent_ = nullptr;
};

} // namespace anndoc
