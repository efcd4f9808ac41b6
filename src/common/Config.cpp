#include "haven/common/Config.h"
#include "haven/common/Logger.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <strings.h>

namespace haven {
namespace common {

namespace {

std::string Strip(const std::string& s) {
    size_t first = 0;
    size_t last = s.size();
    while (first < last && std::isspace(static_cast<unsigned char>(s[first]))) ++first;
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1]))) --last;
    return s.substr(first, last - first);
}

bool OneOf(const std::string& value, const char* const* words) {
    for (; *words; ++words) {
        if (::strcasecmp(value.c_str(), *words) == 0) return true;
    }
    return false;
}

} // namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

Config::Settings Config::Parse(std::istream& in) {
    Settings parsed;
    Section* current = &parsed["global"];
    std::string raw;
    int lineNo = 0;
    while (std::getline(in, raw)) {
        ++lineNo;
        const std::string line = Strip(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            current = &parsed[Strip(line.substr(1, line.size() - 2))];
            continue;
        }
        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_WARN << "Config: line " << lineNo << " has no '=', ignored: " << line;
            continue;
        }
        const std::string key = Strip(line.substr(0, eq));
        if (!key.empty()) {
            (*current)[key] = Strip(line.substr(eq + 1));
        }
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        LOG_ERROR << "Config: cannot open " << filename;
        return false;
    }
    Settings parsed = Parse(file);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.swap(parsed);
        loadedFilename_ = filename;
    }
    LOG_INFO << "Config: loaded " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    Settings parsed = Parse(in);
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.swap(parsed);
    return true;
}

void Config::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
    loadedFilename_.clear();
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

std::optional<std::string> Config::Lookup(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto sec = settings_.find(section);
    if (sec == settings_.end()) return std::nullopt;
    const auto entry = sec->second.find(key);
    if (entry == sec->second.end()) return std::nullopt;
    return entry->second;
}

std::string Config::GetString(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    return Lookup(section, key).value_or(defaultVal);
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    const std::optional<std::string> text = Lookup(section, key);
    if (!text || text->empty()) return defaultVal;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(text->c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) {
        LOG_WARN << "Config: [" << section << "] " << key << " = " << *text << " is not an integer";
        return defaultVal;
    }
    return static_cast<int>(v);
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    static const char* const kTrue[] = {"1", "true", "yes", "on", nullptr};
    static const char* const kFalse[] = {"0", "false", "no", "off", nullptr};
    const std::optional<std::string> text = Lookup(section, key);
    if (!text || text->empty()) return defaultVal;
    if (OneOf(*text, kTrue)) return true;
    if (OneOf(*text, kFalse)) return false;
    LOG_WARN << "Config: [" << section << "] " << key << " = " << *text << " is not a boolean";
    return defaultVal;
}

} // namespace common
} // namespace haven
