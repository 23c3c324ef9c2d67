// =================================================================
// src/NameFmt/Config.cpp
// =================================================================
// Defaults and style name conversions for the configuration model.

#include "NameFmt/Config.hpp"

namespace NameFmt {

std::vector<std::string> DetectionRules::defaultExeExtensions() {
    return {"exe", "bin", "app"};
}

std::vector<std::string> DetectionRules::defaultPackageDirs() {
    return {"package.json", "Cargo.toml", "pyproject.toml"};
}

std::string NamingStyleUtils::toString(NamingStyle style) {
    switch (style) {
        case NamingStyle::CamelCase: return "camelCase";
        case NamingStyle::SnakeCase: return "snake_case";
        case NamingStyle::KebabCase: return "kebab-case";
    }
    return "unknown";
}

std::optional<NamingStyle> NamingStyleUtils::fromString(const std::string& name) {
    if (name == "camelCase") return NamingStyle::CamelCase;
    if (name == "snake_case") return NamingStyle::SnakeCase;
    if (name == "kebab-case") return NamingStyle::KebabCase;
    return std::nullopt;
}

} // namespace NameFmt
