#include "anndoc/settings.h"
#include "anndoc/fields.h"

#include <pugixml.hpp>

#include <stdexcept>

namespace anndoc {

namespace {

const char* const kDefaultSettingsFile = "./anndoc.xml";

// Earlier sources win: the command line, then the item, then the root defaults.
void merge_attributes(Settings& settings, const pugi::xml_node& node) {
    for (const auto& attr : node.attributes()) {
        if (settings.has(attr.name())) {
            continue;
        }
        settings.set(attr.name(), attr.value());
    }
}

} // namespace

std::string Settings::get(const std::string& key, const std::string& fallback) const {
    auto it = options_.find(key);
    return it == options_.end() ? fallback : it->second;
}

int Settings::get_int(const std::string& key, int fallback) const {
    if (!has(key)) {
        return fallback;
    }
    return require_int(get(key), ("for option --" + key).c_str());
}

bool Settings::get_bool(const std::string& key, bool fallback) const {
    if (!has(key)) {
        return fallback;
    }
    std::string value = get(key);
    return value == "1" || value == "true" || value == "yes";
}

Settings parse_arguments(int argc, char** argv) {
    Settings settings;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 3 || arg.compare(0, 2, "--") != 0) {
            continue;
        }
        std::size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            settings.set(arg.substr(2), "1");
        } else {
            settings.set(arg.substr(2, eq - 2), arg.substr(eq + 1));
        }
    }
    return settings;
}

Settings load_settings(const Settings& base) {
    std::string path = base.settings_file().empty() ? kDefaultSettingsFile : base.settings_file();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::runtime_error("Failed to load settings file: " + path + " (" + result.description() + ")");
    }

    pugi::xml_node selected;
    for (const auto& node : doc.select_nodes("/anndoc/parameters/item")) {
        if (base.pid().empty() || base.pid() == node.node().attribute("pid").value()) {
            selected = node.node();
            break;
        }
    }
    if (!selected) {
        throw std::runtime_error("No matching parameter set in " + path +
                                 (base.pid().empty() ? std::string() : " for pid " + base.pid()));
    }

    Settings combined = base;
    merge_attributes(combined, selected);
    merge_attributes(combined, doc.child("anndoc"));
    return combined;
}

} // namespace anndoc
