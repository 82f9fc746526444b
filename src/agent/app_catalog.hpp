#pragma once
// =============================================================================
// DroidPilot - App name -> Android package catalogue
// =============================================================================
#include <map>
#include <optional>
#include <string>

namespace droidpilot::agent {

class AppCatalog {
public:
    // Starts with the built-in table of common apps
    AppCatalog();

    void add(const std::string& name, const std::string& package);
    void addAll(const std::map<std::string, std::string>& entries);

    // Case-insensitive name lookup. Identifiers that already look like a
    // package id ("com.example.app") resolve to themselves.
    std::optional<std::string> resolve(const std::string& name) const;

    size_t size() const { return packages_.size(); }

    static bool looksLikePackage(const std::string& id);

private:
    std::map<std::string, std::string> packages_;  // lower-case name -> package
};

} // namespace droidpilot::agent
