#ifndef INI_CONFIG_HPP
#define INI_CONFIG_HPP

#include <istream>
#include <map>
#include <string>
#include <vector>

/**
 * Minimal INI reader/writer: [section] headers, key = value pairs, ';' and
 * '#' comment lines. Inline comments start with " ;" or " #".
 */
class IniConfig {
public:
    bool load(const std::string& filename);
    void parse(std::istream& input);
    bool save(const std::string& filename) const;

    std::string get_value(const std::string& section,
                          const std::string& key,
                          const std::string& default_value = "") const;
    void set_value(const std::string& section, const std::string& key, const std::string& value);
    bool has_value(const std::string& section, const std::string& key) const;

    /// Section names in file order.
    std::vector<std::string> sections() const;
    bool has_section(const std::string& section) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data_;
    std::vector<std::string> section_order_;

    void remember_section(const std::string& section);
};

#endif
