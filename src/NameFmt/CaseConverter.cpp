// =================================================================
// src/NameFmt/CaseConverter.cpp
// =================================================================
// Implementation of the naming style conversions.

#include "NameFmt/CaseConverter.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace NameFmt {

namespace {

bool isUpper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool isWordSeparator(char c) {
    return c == ' ' || c == '_' || c == '-';
}

std::vector<std::string> splitWords(const std::string& input) {
    std::vector<std::string> words;
    std::string current;
    for (char c : input) {
        if (isWordSeparator(c)) {
            if (!current.empty()) {
                words.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

// Position of the first upper-case character that follows a
// non-upper-case one, or the word length when there is none.
size_t findFirstHump(const std::string& word) {
    for (size_t i = 1; i < word.size(); ++i) {
        if (isUpper(word[i]) && !isUpper(word[i - 1])) {
            return i;
        }
    }
    return word.size();
}

} // namespace

std::string CaseConverter::applyStyle(const std::string& name, NamingStyle style) {
    switch (style) {
        case NamingStyle::CamelCase: return toCamelCase(name);
        case NamingStyle::SnakeCase: return toSnakeCase(name);
        case NamingStyle::KebabCase: return toKebabCase(name);
    }
    return name;
}

std::string CaseConverter::toCamelCase(const std::string& input) {
    std::string result;
    bool first_word = true;

    for (auto& word : splitWords(input)) {
        if (first_word) {
            // Only the leading segment is lowered so that an existing
            // camelCase word survives a second pass unchanged.
            size_t hump = findFirstHump(word);
            result += toLower(word.substr(0, hump));
            result += word.substr(hump);
            first_word = false;
        } else {
            word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
            result += word;
        }
    }

    return result;
}

std::string CaseConverter::toSnakeCase(const std::string& input) {
    return separateWords(input, '_', " -");
}

std::string CaseConverter::toKebabCase(const std::string& input) {
    return separateWords(input, '-', " _");
}

std::string CaseConverter::toLower(std::string input) {
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return input;
}

std::string CaseConverter::separateWords(const std::string& input, char separator,
                                         const std::string& replaced_chars) {
    std::string result;
    result.reserve(input.size() + input.size() / 2);

    auto append_separator = [&result, separator]() {
        if (!result.empty() && result.back() != separator) {
            result += separator;
        }
    };

    for (char c : input) {
        if (isUpper(c)) {
            append_separator();
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (c == separator || replaced_chars.find(c) != std::string::npos) {
            append_separator();
        } else {
            result += c;
        }
    }

    return result;
}

} // namespace NameFmt
