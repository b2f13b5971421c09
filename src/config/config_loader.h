#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include <map>
#include <string>

namespace FallGuardSDK {

// ==========================================
// Config Loader (Simple INI Parser)
// ==========================================
// Keys are stored as "Section.Key". Lines starting with ';' or '#' are comments.
class ConfigLoader {
public:
    bool load(const std::string& filename);
    bool loadFromString(const std::string& text);

    bool has(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& defaultVal) const;
    int getInt(const std::string& key, int defaultVal) const;
    double getDouble(const std::string& key, double defaultVal) const;
    bool getBool(const std::string& key, bool defaultVal) const;

    size_t size() const { return data.size(); }

private:
    static std::string trim(const std::string& str);
    void parseLine(const std::string& raw, std::string& section);

    std::map<std::string, std::string> data;
};

} // namespace FallGuardSDK

#endif // CONFIG_LOADER_H
