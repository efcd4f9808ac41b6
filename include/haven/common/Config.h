#pragma once

#include "haven/common/noncopyable.h"

#include <istream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace haven {
namespace common {

// Process-wide INI settings.
//
//   # comment            ; also a comment
//   key = value          (before any header: section "global")
//   [section]
//   key = value
//
// Lookups are thread safe. A reload replaces every section at once.
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Same syntax as Load(); LoadedFilename() is left alone.
    bool LoadFromString(const std::string& iniText);
    void Clear();

    std::optional<std::string> LoadedFilename() const;

    std::string GetString(const std::string& section, const std::string& key,
                          const std::string& defaultVal = "") const;
    // Missing or non-numeric values yield the default.
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    // 1/0, true/false, yes/no, on/off in any case.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

private:
    using Section = std::map<std::string, std::string>;
    using Settings = std::map<std::string, Section>;

    Config() = default;

    static Settings Parse(std::istream& in);
    std::optional<std::string> Lookup(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace haven
