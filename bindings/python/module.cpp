#include "anndoc/document.h"
#include "anndoc/fields.h"
#include "anndoc/io_json.h"
#include "anndoc/unicode_utils.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

using anndoc::Document;
using anndoc::Field;
using anndoc::FieldRecord;
using anndoc::FieldValue;
using anndoc::OptionalValue;
using anndoc::SentenceEntries;
using anndoc::unicode::sanitize_utf8;

namespace {

FieldRecord record_from_py(const py::dict& entry) {
    FieldRecord record;
    for (const auto& item : entry) {
        Field field = anndoc::parse_field(py::cast<std::string>(item.first));
        if (item.second.is_none()) {
            continue;
        }
        if (py::isinstance<py::int_>(item.second) && !py::isinstance<py::bool_>(item.second)) {
            record.set(field, py::cast<int>(item.second));
        } else {
            record.set(field, py::cast<std::string>(py::str(item.second)));
        }
    }
    return record;
}

py::object value_to_py(const OptionalValue& value) {
    if (!value) {
        return py::none();
    }
    if (const auto* number = std::get_if<int>(&*value)) {
        return py::int_(*number);
    }
    return py::str(sanitize_utf8(std::get<std::string>(*value)));
}

OptionalValue value_from_py(const py::handle& value) {
    if (value.is_none()) {
        return std::nullopt;
    }
    if (py::isinstance<py::int_>(value) && !py::isinstance<py::bool_>(value)) {
        return FieldValue(py::cast<int>(value));
    }
    return FieldValue(py::cast<std::string>(py::str(value)));
}

py::dict record_to_py(const FieldRecord& record) {
    py::dict out;
    for (const auto& [field, value] : record) {
        out[py::str(anndoc::field_name(field))] = value_to_py(value);
    }
    return out;
}

std::vector<SentenceEntries> sentences_from_py(const py::list& sentences) {
    std::vector<SentenceEntries> entries;
    entries.reserve(sentences.size());
    for (const auto& sentence : sentences) {
        SentenceEntries sentence_entries;
        for (const auto& entry : py::cast<py::list>(sentence)) {
            sentence_entries.push_back(record_from_py(py::cast<py::dict>(entry)));
        }
        entries.push_back(std::move(sentence_entries));
    }
    return entries;
}

std::unique_ptr<Document> make_document(const py::list& sentences, const py::object& text) {
    std::optional<std::string> raw_text;
    if (!text.is_none()) {
        raw_text = py::cast<std::string>(text);
    }
    return std::make_unique<Document>(sentences_from_py(sentences), raw_text);
}

py::list values_to_py(const std::vector<OptionalValue>& values) {
    py::list out;
    for (const auto& value : values) {
        out.append(value_to_py(value));
    }
    return out;
}

py::list rows_to_py(const std::vector<std::vector<OptionalValue>>& rows) {
    py::list out;
    for (const auto& row : rows) {
        out.append(values_to_py(row));
    }
    return out;
}

// One field gives plain values, several give one row per Word.
py::list document_get(const Document& doc, const std::vector<std::string>& names, bool as_sentences) {
    std::vector<Field> fields = anndoc::parse_fields(names);
    if (fields.size() == 1) {
        if (!as_sentences) {
            return values_to_py(doc.get(fields[0]));
        }
        py::list out;
        for (const auto& sentence : doc.get_sentences(fields[0])) {
            out.append(values_to_py(sentence));
        }
        return out;
    }
    if (!as_sentences) {
        return rows_to_py(doc.get(fields));
    }
    py::list out;
    for (const auto& sentence : doc.get_sentences(fields)) {
        out.append(rows_to_py(sentence));
    }
    return out;
}

void document_set(Document& doc, const std::vector<std::string>& names, const py::list& contents) {
    std::vector<Field> fields = anndoc::parse_fields(names);
    std::vector<std::vector<OptionalValue>> rows;
    rows.reserve(contents.size());
    for (const auto& item : contents) {
        std::vector<OptionalValue> row;
        if (fields.size() == 1) {
            row.push_back(value_from_py(item));
        } else {
            for (const auto& value : py::cast<py::list>(item)) {
                row.push_back(value_from_py(value));
            }
        }
        rows.push_back(std::move(row));
    }
    doc.set(fields, rows);
}

py::list document_to_dict(const Document& doc) {
    py::list sentences;
    for (const auto& entries : doc.to_records()) {
        py::list sentence;
        for (const auto& record : entries) {
            sentence.append(record_to_py(record));
        }
        sentences.append(sentence);
    }
    return sentences;
}

py::list mwt_expansions_to_py(const Document& doc, bool evaluation) {
    py::list out;
    for (const auto& expansion : doc.get_mwt_expansions(evaluation)) {
        if (evaluation) {
            out.append(py::str(sanitize_utf8(expansion.source)));
        } else {
            out.append(py::make_tuple(sanitize_utf8(expansion.source), sanitize_utf8(*expansion.expansion)));
        }
    }
    return out;
}

py::list entities_to_py(const Document& doc) {
    py::list out;
    for (const auto& span : doc.entities()) {
        out.append(record_to_py(span.to_record()));
    }
    return out;
}

// Per sentence: (head id, deprel, dependent id) triples.
py::list dependencies_to_py(const Document& doc) {
    py::list out;
    for (const auto& sentence : doc.sentences()) {
        py::list edges;
        for (const auto& edge : sentence.dependencies()) {
            edges.append(py::make_tuple(edge.head->id(), edge.deprel, edge.dependent->id()));
        }
        out.append(edges);
    }
    return out;
}

} // namespace

PYBIND11_MODULE(anndoc_py, m) {
    m.doc() = "Annotated document model: words, tokens, sentences, entity spans";

    py::class_<Document, std::unique_ptr<Document>>(m, "Document")
        .def(py::init(&make_document), py::arg("sentences"), py::arg("text") = py::none())
        .def_property_readonly("num_words", &Document::num_words)
        .def_property("text", &Document::text, &Document::set_text)
        .def("get", &document_get, py::arg("fields"), py::arg("as_sentences") = false)
        .def("set", &document_set, py::arg("fields"), py::arg("contents"))
        .def("set_mwt_expansions", &Document::set_mwt_expansions, py::arg("expansions"))
        .def("get_mwt_expansions", &mwt_expansions_to_py, py::arg("evaluation") = false)
        .def("build_ents", &Document::build_ents)
        .def("rebuild_sentence", &Document::rebuild_sentence, py::arg("index"))
        .def_property_readonly("entities", &entities_to_py)
        .def_property_readonly("dependencies", &dependencies_to_py)
        .def("to_dict", &document_to_dict)
        .def("__repr__", [](const Document& doc) { return anndoc::dump_json(doc); });

    m.def("load_json", &anndoc::load_json, py::arg("path"),
          "Load a document from its JSON serialized form");
    m.def("dump_json", [](const Document& doc, int indent) { return anndoc::dump_json(doc, indent); },
          py::arg("document"), py::arg("indent") = 2);
}
