#pragma once

#include <map>
#include <string>

namespace anndoc {

// Options of anndoc_cli, keyed by option name without the leading dashes.
// Values come from --key=value arguments and an optional XML parameter set.
class Settings {
public:
    void set(const std::string& key, const std::string& value) { options_[key] = value; }
    bool has(const std::string& key) const { return options_.count(key) > 0; }

    std::string get(const std::string& key, const std::string& fallback = "") const;
    // Throws std::invalid_argument when the value is not an integer.
    int get_int(const std::string& key, int fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;

    std::string input() const { return get("input"); }
    std::string outfile() const { return get("outfile"); }
    std::string text_file() const { return get("text"); }
    std::string expansions_file() const { return get("expansions"); }
    std::string settings_file() const { return get("settings"); }
    std::string pid() const { return get("pid"); }
    bool verbose() const { return get_bool("verbose", false); }
    bool debug() const { return get_bool("debug", false); }

private:
    std::map<std::string, std::string> options_;
};

// --key=value sets key; a bare --flag sets it to "1". Other arguments are ignored.
Settings parse_arguments(int argc, char** argv);

// Adds the parameter set selected by pid (or the first one) from the XML file
// named by --settings, default ./anndoc.xml. Item attributes come first, then
// the attributes of the <anndoc> root as defaults; neither overrides a key the
// command line already set. Throws std::runtime_error when the file cannot be
// read or has no matching set.
Settings load_settings(const Settings& base);

} // namespace anndoc
