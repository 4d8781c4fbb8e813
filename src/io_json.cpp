#include "anndoc/io_json.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace anndoc {

nlohmann::json record_to_json(const FieldRecord& record) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [field, value] : record) {
        if (const auto* number = std::get_if<int>(&value)) {
            object[field_name(field)] = *number;
        } else {
            object[field_name(field)] = std::get<std::string>(value);
        }
    }
    return object;
}

FieldRecord record_from_json(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw std::invalid_argument("Field record must be a JSON object");
    }
    FieldRecord record;
    for (const auto& [key, value] : object.items()) {
        Field field = parse_field(key);
        if (value.is_null()) {
            continue;
        } else if (value.is_number_integer()) {
            record.set(field, value.get<int>());
        } else if (value.is_string()) {
            record.set(field, value.get<std::string>());
        } else {
            throw std::invalid_argument("Unsupported value for field " + key + ": " + value.dump());
        }
    }
    return record;
}

nlohmann::json document_to_json(const Document& doc) {
    nlohmann::json sentences = nlohmann::json::array();
    for (const auto& entries : doc.to_records()) {
        nlohmann::json sentence = nlohmann::json::array();
        for (const auto& record : entries) {
            sentence.push_back(record_to_json(record));
        }
        sentences.push_back(std::move(sentence));
    }
    return sentences;
}

nlohmann::json entities_to_json(const Document& doc) {
    nlohmann::json entities = nlohmann::json::array();
    for (const auto& span : doc.entities()) {
        entities.push_back(record_to_json(span.to_record()));
    }
    return entities;
}

std::unique_ptr<Document> parse_json(const std::string& content) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error(std::string("Malformed document JSON: ") + ex.what());
    }

    std::optional<std::string> text;
    const nlohmann::json* sentences = &root;
    if (root.is_object()) {
        auto text_it = root.find("text");
        if (text_it != root.end() && text_it->is_string()) {
            text = text_it->get<std::string>();
        }
        auto sentences_it = root.find("sentences");
        if (sentences_it == root.end()) {
            throw std::runtime_error("Document JSON object has no \"sentences\" member");
        }
        sentences = &*sentences_it;
    }
    if (!sentences->is_array()) {
        throw std::runtime_error("Document sentences must be a JSON array");
    }

    std::vector<SentenceEntries> entries;
    entries.reserve(sentences->size());
    try {
        for (const auto& sentence : *sentences) {
            if (!sentence.is_array()) {
                throw std::invalid_argument("Each sentence must be a JSON array");
            }
            SentenceEntries sentence_entries;
            for (const auto& object : sentence) {
                sentence_entries.push_back(record_from_json(object));
            }
            entries.push_back(std::move(sentence_entries));
        }
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(std::string("Invalid document JSON: ") + ex.what());
    }
    return std::make_unique<Document>(entries, text);
}

std::unique_ptr<Document> load_json(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open document file: " + path);
    }
    std::ostringstream content;
    content << input.rdbuf();
    return parse_json(content.str());
}

std::string dump_json(const Document& doc, int indent, bool include_text) {
    nlohmann::json sentences = document_to_json(doc);
    if (include_text && doc.text()) {
        nlohmann::json root = nlohmann::json::object();
        root["text"] = *doc.text();
        root["sentences"] = std::move(sentences);
        return root.dump(indent);
    }
    return sentences.dump(indent);
}

void save_json(const Document& doc, const std::string& path, int indent, bool include_text) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    out << dump_json(doc, indent, include_text) << "\n";
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

} // namespace anndoc
