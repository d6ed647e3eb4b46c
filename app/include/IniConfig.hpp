#ifndef INI_CONFIG_HPP
#define INI_CONFIG_HPP

#include <map>
#include <optional>
#include <string>

// Flat [Section] key = value store backing Settings
class IniConfig {
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);

    // Accepts true/false, yes/no, on/off and 1/0; anything else yields default_value
    bool getBool(const std::string& section, const std::string& key, bool default_value) const;
    std::optional<long> getInt(const std::string& section, const std::string& key) const;

private:
    using Section = std::map<std::string, std::string>;

    const std::string* find(const std::string& section, const std::string& key) const;
    bool read_line(const std::string& raw_line, std::string& section);

    std::map<std::string, Section> sections;
};

#endif
