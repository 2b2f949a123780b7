#include "storage/identifier.h"

#include <cctype>
#include <regex>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace wcopt::storage {

bool IsValidIdentifier(std::string_view name) {
    if (name.empty() || name.size() > kMaxIdentifierLength) {
        return false;
    }
    static const std::regex identifier_regex("^[A-Za-z_][A-Za-z0-9_]*$");
    return std::regex_match(name.begin(), name.end(), identifier_regex);
}

absl::Status ValidateIdentifier(std::string_view name, std::string_view what) {
    if (!IsValidIdentifier(name)) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid ", absl::string_view(what.data(), what.size()), " '", absl::string_view(name.data(), name.size()),
                         "': only letters, digits and underscores are allowed"));
    }
    return absl::OkStatus();
}

std::string QuoteIdentifier(std::string_view name) {
    return absl::StrCat("\"", absl::string_view(name.data(), name.size()), "\"");
}

std::string NormalizeColumnName(std::string_view header) {
    std::string out;
    out.reserve(header.size());
    bool pending_underscore = false;
    for (char raw : absl::StripAsciiWhitespace(absl::string_view(header.data(), header.size()))) {
        unsigned char c = static_cast<unsigned char>(raw);
        if (std::isalnum(c)) {
            if (pending_underscore && !out.empty()) {
                out += '_';
            }
            pending_underscore = false;
            out += static_cast<char>(std::tolower(c));
        } else if (c == '_' || c == ' ' || c == '-' || c == '.') {
            pending_underscore = true;
        }
        // Anything else ("$", "%", "(", ...) is dropped
    }
    if (!out.empty() && std::isdigit(static_cast<unsigned char>(out.front()))) {
        out.insert(out.begin(), '_');
    }
    return out;
}

}  // namespace wcopt::storage
