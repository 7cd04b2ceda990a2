#include "OracleIdentifier.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace oraenhanced {

namespace {

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::vector<std::string> split(const std::string& str, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '#';
}

// Letter followed by up to maxTail identifier characters
bool isNonquotedName(const std::string& name, size_t maxTail, bool allowLinkChars = false) {
    if (name.empty() || name.size() > maxTail + 1) return false;
    if (!std::isalpha(static_cast<unsigned char>(name[0]))) return false;
    for (size_t i = 1; i < name.size(); ++i) {
        char c = name[i];
        if (isIdentChar(c)) continue;
        if (allowLinkChars && (c == '.' || c == '@')) continue;
        return false;
    }
    return true;
}

bool isPlainLowercaseName(const std::string& name) {
    if (name.empty() || !std::islower(static_cast<unsigned char>(name[0]))) return false;
    for (char c : name) {
        bool ok = std::islower(static_cast<unsigned char>(c)) ||
                  std::isdigit(static_cast<unsigned char>(c)) ||
                  c == '_' || c == '$' || c == '#';
        if (!ok) return false;
    }
    return true;
}

}  // namespace

bool OracleIdentifier::isValidTableName(const std::string& name) {
    std::string objectPart = name;
    auto at = name.find('@');
    if (at != std::string::npos) {
        objectPart = name.substr(0, at);
        if (!isNonquotedName(name.substr(at + 1), 127, true)) {
            return false;
        }
    }

    auto parts = split(objectPart, '.');
    if (parts.size() > 2) {
        return false;
    }
    for (const auto& part : parts) {
        if (!isNonquotedName(part, 29)) {
            return false;
        }
    }
    return !isMixedCase(objectPart);
}

bool OracleIdentifier::isMixedCase(const std::string& name) {
    std::string objectName = name;
    auto dot = name.find('.');
    if (dot != std::string::npos) {
        objectName = split(name, '.')[1];
    }
    bool hasUpper = std::any_of(objectName.begin(), objectName.end(),
                                [](unsigned char c) { return std::isupper(c); });
    bool hasLower = std::any_of(objectName.begin(), objectName.end(),
                                [](unsigned char c) { return std::islower(c); });
    return hasUpper && hasLower;
}

bool OracleIdentifier::isDbLinkReference(const std::string& raw) {
    return raw.find('@') != std::string::npos;
}

TableReference OracleIdentifier::parseTableReference(const std::string& raw,
                                                     const std::string& defaultOwner) {
    std::string realName = isValidTableName(raw) ? toUpper(raw) : raw;

    TableReference ref;
    auto at = realName.find('@');
    if (at != std::string::npos) {
        ref.dbLink = realName.substr(at);
        realName = realName.substr(0, at);
    }

    auto dot = realName.find('.');
    if (dot != std::string::npos) {
        ref.owner = realName.substr(0, dot);
        ref.name = realName.substr(dot + 1);
    } else {
        ref.owner = defaultOwner;
        ref.name = realName;
    }
    return ref;
}

std::string OracleIdentifier::oracleDowncase(const std::string& name) {
    bool hasLower = std::any_of(name.begin(), name.end(),
                                [](unsigned char c) { return std::islower(c); });
    return hasLower ? name : toLower(name);
}

std::optional<std::string> OracleIdentifier::oracleDowncase(const std::optional<std::string>& name) {
    if (!name) return std::nullopt;
    return oracleDowncase(*name);
}

std::string OracleIdentifier::quoteColumnName(const std::string& name) {
    if (isPlainLowercaseName(name)) {
        return "\"" + toUpper(name) + "\"";
    }
    std::string cleaned;
    cleaned.reserve(name.size());
    for (char c : name) {
        if (c != '"') cleaned += c;
    }
    return "\"" + cleaned + "\"";
}

std::string OracleIdentifier::quoteTableName(const std::string& name) {
    std::string objectPart = name;
    std::string link;
    auto at = name.find('@');
    if (at != std::string::npos) {
        objectPart = name.substr(0, at);
        link = name.substr(at);
    }

    std::string result;
    for (const auto& part : split(objectPart, '.')) {
        if (!result.empty()) result += ".";
        result += quoteColumnName(part);
    }
    return result + link;
}

std::string OracleIdentifier::quoteString(const std::string& value) {
    std::string result;
    result.reserve(value.size() + 8);
    for (char c : value) {
        if (c == '\'') {
            result += "''";
        } else {
            result += c;
        }
    }
    return result;
}

std::string OracleIdentifier::quote(const std::string& value) {
    return "'" + quoteString(value) + "'";
}

}  // namespace oraenhanced
