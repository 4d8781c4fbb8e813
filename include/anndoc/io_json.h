#pragma once

#include "document.h"
#include "fields.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace anndoc {

nlohmann::json record_to_json(const FieldRecord& record);
// Unknown keys are rejected with std::invalid_argument; null values are skipped.
FieldRecord record_from_json(const nlohmann::json& object);

nlohmann::json document_to_json(const Document& doc);
nlohmann::json entities_to_json(const Document& doc);

// Accepts either a bare array of sentences or {"text": ..., "sentences": [...]}.
// Throws std::runtime_error on malformed input.
std::unique_ptr<Document> parse_json(const std::string& content);
std::unique_ptr<Document> load_json(const std::string& path);

// Without the raw text this is the serialized form: an array of sentences,
// each an array of field records. With text it is wrapped in an object.
std::string dump_json(const Document& doc, int indent = 2, bool include_text = false);
void save_json(const Document& doc, const std::string& path, int indent = 2, bool include_text = false);

} // namespace anndoc
