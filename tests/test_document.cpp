#include "anndoc/document.h"

#include "test_helpers.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace anndoc;
using anndoc::testing::as_text;
using anndoc::testing::parsed_sentence;
using anndoc::testing::spaced_sentence;

namespace {

std::unique_ptr<Document> two_sentence_doc() {
    std::string text;
    auto first = spaced_sentence(text, {"Alice", "sings", "."});
    auto second = spaced_sentence(text, {"Bob", "dances", "well", "."});
    return std::make_unique<Document>(std::vector<SentenceEntries>{first, second}, text);
}

} // namespace

TEST(Document, CountsWords) {
    auto doc = two_sentence_doc();
    EXPECT_EQ(doc->sentences().size(), 2u);
    EXPECT_EQ(doc->num_words(), 7u);
}

TEST(Document, GetReturnsOneValuePerWordForEveryField) {
    auto doc = two_sentence_doc();
    for (Field field : {Field::Id, Field::Text, Field::Lemma, Field::Upos, Field::Xpos, Field::Feats,
                        Field::Head, Field::Deprel, Field::Deps, Field::Misc, Field::Ner,
                        Field::StartChar, Field::EndChar, Field::Type}) {
        EXPECT_EQ(doc->get(field).size(), doc->num_words()) << field_name(field);
    }
    for (const auto& value : doc->get(Field::Type)) {
        EXPECT_FALSE(value.has_value());
    }
    auto texts = doc->get(Field::Text);
    EXPECT_EQ(as_text(texts[0]), "Alice");
    EXPECT_EQ(as_text(texts[3]), "Bob");
    EXPECT_EQ(as_text(texts[6]), ".");
}

TEST(Document, GetMultipleFieldsYieldsRows) {
    auto doc = two_sentence_doc();
    auto rows = doc->get(std::vector<Field>{Field::Id, Field::Text});
    ASSERT_EQ(rows.size(), 7u);
    EXPECT_EQ(as_text(rows[4][0]), "2");
    EXPECT_EQ(as_text(rows[4][1]), "dances");
    EXPECT_THROW(doc->get(std::vector<Field>{}), std::invalid_argument);
}

TEST(Document, GetSentencesGroupsBySentence) {
    auto doc = two_sentence_doc();
    auto grouped = doc->get_sentences(Field::Text);
    ASSERT_EQ(grouped.size(), 2u);
    EXPECT_EQ(grouped[0].size(), 3u);
    EXPECT_EQ(grouped[1].size(), 4u);

    auto rows = doc->get_sentences(std::vector<Field>{Field::Text, Field::StartChar});
    EXPECT_EQ(as_text(rows[1][0][1]), "16");
    EXPECT_THROW(doc->get_sentences(std::vector<Field>{}), std::invalid_argument);
}

TEST(Document, SetThenGetRoundTrips) {
    auto doc = two_sentence_doc();
    std::vector<OptionalValue> tags = {
        FieldValue("PROPN"), FieldValue("VERB"), FieldValue("PUNCT"),
        FieldValue("PROPN"), FieldValue("VERB"), FieldValue("ADV"), FieldValue("PUNCT")};
    doc->set(Field::Upos, tags);
    EXPECT_EQ(doc->get(Field::Upos), tags);

    std::vector<std::vector<OptionalValue>> rows;
    for (std::size_t i = 0; i < doc->num_words(); ++i) {
        rows.push_back({FieldValue("l" + std::to_string(i)), FieldValue(static_cast<int>(i))});
    }
    doc->set(std::vector<Field>{Field::Lemma, Field::Head}, rows);
    EXPECT_EQ(doc->get(std::vector<Field>{Field::Lemma, Field::Head}), rows);
}

TEST(Document, SetRejectsBadShapesWithoutWriting) {
    auto doc = two_sentence_doc();
    std::vector<OptionalValue> short_contents(3, FieldValue("X"));
    EXPECT_THROW(doc->set(Field::Upos, short_contents), std::invalid_argument);
    EXPECT_THROW(doc->set(std::vector<Field>{}, {}), std::invalid_argument);

    std::vector<std::vector<OptionalValue>> narrow(doc->num_words(), std::vector<OptionalValue>{FieldValue("X")});
    EXPECT_THROW(doc->set(std::vector<Field>{Field::Upos, Field::Xpos}, narrow), std::invalid_argument);

    std::vector<OptionalValue> heads(doc->num_words(), FieldValue(1));
    heads.back() = FieldValue("nope");
    EXPECT_THROW(doc->set(Field::Head, heads), std::invalid_argument);
    EXPECT_FALSE(doc->get(Field::Head)[0].has_value());

    std::vector<OptionalValue> offsets(doc->num_words(), FieldValue(0));
    EXPECT_THROW(doc->set(Field::StartChar, offsets), std::invalid_argument);

    for (const auto& value : doc->get(Field::Upos)) {
        EXPECT_FALSE(value.has_value());
    }
}

TEST(Document, SetMarksDerivedViewsStale) {
    auto doc = std::make_unique<Document>(std::vector<SentenceEntries>{parsed_sentence()});
    const Sentence& sentence = doc->sentences()[0];
    EXPECT_EQ(sentence.dependencies().size(), 3u);
    EXPECT_FALSE(sentence.dependencies_stale());

    doc->set(Field::Upos, std::vector<OptionalValue>(3, FieldValue("X")));
    EXPECT_FALSE(sentence.dependencies_stale());
    EXPECT_FALSE(doc->entities_stale());

    doc->set(Field::Head, {FieldValue(3), FieldValue(3), FieldValue(0)});
    EXPECT_TRUE(sentence.dependencies_stale());
    doc->rebuild_sentence(0);
    EXPECT_FALSE(sentence.dependencies_stale());
    EXPECT_EQ(sentence.dependencies()[0].head->text(), "sleeps");

    doc->set(Field::Ner, {FieldValue("S-ANIMAL"), FieldValue("O"), FieldValue("O")});
    EXPECT_TRUE(doc->entities_stale());
    EXPECT_EQ(doc->build_ents(), 1u);
    EXPECT_FALSE(doc->entities_stale());
}

TEST(Document, RebuiltSentenceUpdatesWordCount) {
    SentenceEntries entries = {
        {{Field::Id, "1-2"}, {Field::Text, "du"}},
        {{Field::Id, "1"}, {Field::Text, "de"}},
        {{Field::Id, "3"}, {Field::Text, "pain"}},
    };
    Document doc(std::vector<SentenceEntries>{entries});
    ASSERT_EQ(doc.num_words(), 2u);

    doc.iter_tokens().begin()->add_word(std::make_unique<Word>(FieldRecord{{Field::Id, "2"}, {Field::Text, "le"}}));
    EXPECT_EQ(doc.num_words(), 2u);
    doc.rebuild_sentence(0);
    EXPECT_EQ(doc.num_words(), 3u);
    EXPECT_EQ(doc.get(Field::Text).size(), 3u);

    std::vector<OptionalValue> two(2, FieldValue("x"));
    EXPECT_THROW(doc.set(Field::Lemma, two), std::invalid_argument);

    std::vector<OptionalValue> lemmas = {FieldValue("de"), FieldValue("le"), FieldValue("pain")};
    doc.set(Field::Lemma, lemmas);
    EXPECT_EQ(doc.get(Field::Lemma), lemmas);
    EXPECT_THROW(doc.rebuild_sentence(1), std::out_of_range);
}

TEST(Document, RebuiltSentenceInvalidatesEntities) {
    std::string text;
    auto entries = spaced_sentence(text, {"Ada", "Lovelace", "wrote"}, {"B-PER", "E-PER", "O"});
    Document doc({entries}, text);
    ASSERT_EQ(doc.build_ents(), 1u);

    doc.rebuild_sentence(0);
    EXPECT_TRUE(doc.entities().empty());
    EXPECT_TRUE(doc.entities_stale());

    ASSERT_EQ(doc.build_ents(), 1u);
    EXPECT_EQ(doc.entities()[0].words()[0], doc.sentences()[0].words()[0]);
    EXPECT_EQ(doc.entities()[0].text().value(), "Ada Lovelace");
}

TEST(Document, SentenceTextIsSlicedFromRawText) {
    auto doc = two_sentence_doc();
    EXPECT_EQ(doc->sentences()[0].text().value(), "Alice sings .");
    EXPECT_EQ(doc->sentences()[1].text().value(), "Bob dances well .");
}

TEST(Document, SentenceTextCountsCodePoints) {
    // "Café noir" in code points: é is one character, two bytes.
    std::string text = "Caf\xC3\xA9 noir";
    SentenceEntries entries = {
        {{Field::Id, "1"}, {Field::Text, "Caf\xC3\xA9"}, {Field::Misc, "start_char=0|end_char=4"}},
        {{Field::Id, "2"}, {Field::Text, "noir"}, {Field::Misc, "start_char=5|end_char=9"}},
    };
    Document doc({entries}, text);
    EXPECT_EQ(doc.sentences()[0].text().value(), text);
}

TEST(Document, WithoutOffsetsSentenceTextStaysUnset) {
    Document doc({parsed_sentence()}, std::string("The cat sleeps"));
    EXPECT_FALSE(doc.sentences()[0].text().has_value());
}

TEST(Document, IteratesWordsAndTokensLazily) {
    SentenceEntries entries = {
        {{Field::Id, "1-2"}, {Field::Text, "du"}},
        {{Field::Id, "1"}, {Field::Text, "de"}},
        {{Field::Id, "2"}, {Field::Text, "le"}},
        {{Field::Id, "3"}, {Field::Text, "pain"}},
    };
    Document doc(std::vector<SentenceEntries>{entries, SentenceEntries{}, parsed_sentence()});

    std::vector<std::string> words;
    for (const Word& word : doc.iter_words()) {
        words.push_back(word.text());
    }
    EXPECT_EQ(words, (std::vector<std::string>{"de", "le", "pain", "The", "cat", "sleeps"}));

    auto tokens = doc.iter_tokens();
    EXPECT_EQ(tokens.size(), 5u);
    std::size_t first_pass = 0;
    for (const Token& token : tokens) {
        (void)token;
        ++first_pass;
    }
    std::size_t second_pass = 0;
    for (auto it = tokens.begin(); it != tokens.end(); ++it) {
        ++second_pass;
    }
    EXPECT_EQ(first_pass, 5u);
    EXPECT_EQ(second_pass, 5u);
    EXPECT_EQ(tokens.begin()->text(), "du");

    for (Word& word : doc.iter_words()) {
        word.set_upos(std::string("X"));
    }
    EXPECT_EQ(as_text(doc.get(Field::Upos)[4]), "X");
}

TEST(Document, SerializationRoundTripPreservesStructure) {
    std::string text;
    auto first = spaced_sentence(text, {"Paris", "is", "nice"}, {"S-LOC", "O", "O"});
    SentenceEntries second = {
        {{Field::Id, "1-2"}, {Field::Text, "du"}, {Field::Misc, "SpaceAfter=No"}},
        {{Field::Id, "1"}, {Field::Text, "de"}, {Field::Upos, "ADP"}},
        {{Field::Id, "2"}, {Field::Text, "le"}, {Field::Upos, "DET"}},
        {{Field::Id, "3"}, {Field::Text, "pain"}, {Field::Lemma, "pain"}, {Field::Head, 0}},
    };
    Document doc({first, second, parsed_sentence()}, text);

    auto records = doc.to_records();
    Document copy(records, doc.text());

    EXPECT_EQ(copy.sentences().size(), doc.sentences().size());
    EXPECT_EQ(copy.num_words(), doc.num_words());
    for (std::size_t i = 0; i < doc.sentences().size(); ++i) {
        EXPECT_EQ(copy.sentences()[i].tokens().size(), doc.sentences()[i].tokens().size());
        EXPECT_EQ(copy.sentences()[i].words().size(), doc.sentences()[i].words().size());
    }
    for (Field field : {Field::Id, Field::Text, Field::Lemma, Field::Upos, Field::Head,
                        Field::Deprel, Field::Misc, Field::Ner, Field::StartChar}) {
        EXPECT_EQ(copy.get(field), doc.get(field)) << field_name(field);
    }
    EXPECT_EQ(copy.to_records(), records);
    EXPECT_EQ(records[1], second);
}
