#include "anndoc/document.h"
#include "anndoc/io_json.h"
#include "anndoc/settings.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace anndoc;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string format_value(const OptionalValue& value) {
    return value ? value_to_string(*value) : std::string(kNullSentinel);
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto cli_settings = parse_arguments(argc, argv);
        Settings settings;

        if (!cli_settings.settings_file().empty()) {
            settings = load_settings(cli_settings);
        } else {
            settings = cli_settings;
        }

        if (settings.input().empty()) {
            std::cerr << "--input option is required" << std::endl;
            return 1;
        }

        auto doc = load_json(settings.input());
        if (!settings.text_file().empty()) {
            // Sentence texts are sliced at construction, so rebuild with the raw text.
            doc = std::make_unique<Document>(doc->to_records(), read_file(settings.text_file()));
        }
        if (settings.verbose()) {
            std::cerr << "[anndoc] loaded " << doc->sentences().size() << " sentences, "
                      << doc->num_words() << " words from " << settings.input() << std::endl;
        }

        if (!settings.expansions_file().empty()) {
            auto expansions = read_lines(settings.expansions_file());
            // A trailing blank line is not an expansion.
            while (!expansions.empty() && expansions.back().empty()) {
                expansions.pop_back();
            }
            doc->set_mwt_expansions(expansions);
            if (settings.verbose()) {
                std::cerr << "[anndoc] applied " << expansions.size() << " multi-word expansions, "
                          << doc->num_words() << " words" << std::endl;
            }
        }

        if (settings.get_bool("mwt", false)) {
            bool evaluation = settings.get_bool("evaluation", false);
            for (const auto& expansion : doc->get_mwt_expansions(evaluation)) {
                std::cout << expansion.source;
                if (expansion.expansion) {
                    std::cout << "\t" << *expansion.expansion;
                }
                std::cout << "\n";
            }
        }

        if (settings.get_bool("deps", false)) {
            for (const auto& sentence : doc->sentences()) {
                if (settings.debug() && sentence.dependencies().empty()) {
                    std::cerr << "[anndoc] sentence without a complete dependency graph" << std::endl;
                }
                std::cout << sentence.dependencies_string() << "\n\n";
            }
        }

        if (settings.get_bool("ents", false)) {
            std::size_t count = doc->build_ents();
            if (settings.verbose()) {
                std::cerr << "[anndoc] " << count << " entities" << std::endl;
            }
            std::cout << entities_to_json(*doc).dump(settings.get_int("indent", 2)) << "\n";
        }

        const std::string get_fields = settings.get("get");
        if (!get_fields.empty()) {
            auto fields = parse_fields(split_list(get_fields));
            for (const auto& row : doc->get(fields)) {
                for (std::size_t i = 0; i < row.size(); ++i) {
                    if (i > 0) {
                        std::cout << "\t";
                    }
                    std::cout << format_value(row[i]);
                }
                std::cout << "\n";
            }
        }

        if (!settings.outfile().empty()) {
            save_json(*doc, settings.outfile(), settings.get_int("indent", 2), settings.get_bool("with-text", false));
            if (settings.verbose()) {
                std::cerr << "[anndoc] wrote " << settings.outfile() << std::endl;
            }
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
