// =================================================================
// include/NameFmt/CaseConverter.hpp
// =================================================================
// Pure string transforms between naming styles.

#pragma once

#include "NameFmt/Config.hpp"
#include <string>

namespace NameFmt {

/**
 * @brief Converts names between camelCase, snake_case and kebab-case
 *
 * All conversions are total and idempotent on their own output.
 * Character classification is ASCII only; other bytes (including
 * UTF-8 sequences) pass through untouched.
 */
class CaseConverter {
public:
    /**
     * @brief Apply the given naming style to a name
     * @param name Input name
     * @param style Target style
     * @return Converted name
     */
    static std::string applyStyle(const std::string& name, NamingStyle style);

    /**
     * @brief Convert to camelCase
     *
     * Splits on space, underscore and hyphen. The first word is
     * lower-cased; later words get an upper-case first character and
     * keep the rest of their casing.
     */
    static std::string toCamelCase(const std::string& input);

    /**
     * @brief Convert to snake_case
     *
     * Upper-case characters start a new word, spaces and hyphens become
     * underscores. Never produces a leading or doubled underscore.
     */
    static std::string toSnakeCase(const std::string& input);

    /**
     * @brief Convert to kebab-case
     *
     * Same as toSnakeCase with '-' as separator; spaces and underscores
     * become hyphens.
     */
    static std::string toKebabCase(const std::string& input);

    /**
     * @brief Lower-case every ASCII letter
     */
    static std::string toLower(std::string input);

private:
    static std::string separateWords(const std::string& input, char separator,
                                     const std::string& replaced_chars);
};

} // namespace NameFmt
