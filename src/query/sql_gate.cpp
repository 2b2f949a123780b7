/// @file sql_gate.cpp
/// @brief Read-only gate in front of ad-hoc SQL

#include "query/sql_gate.h"

#include <cctype>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace wcopt::query {

const std::vector<std::string>& SqlGate::BlockedKeywords() {
    static const std::vector<std::string> keywords = {
        "INSERT", "UPDATE", "DELETE", "DROP", "ALTER", "CREATE", "TRUNCATE",
    };
    return keywords;
}

std::optional<std::string> SqlGate::FindBlockedKeyword(std::string_view sql) {
    const std::string upper_sql = absl::AsciiStrToUpper(absl::string_view(sql.data(), sql.size()));
    for (const auto& keyword : BlockedKeywords()) {
        if (upper_sql.find(keyword) != std::string::npos) {
            return keyword;
        }
    }
    return std::nullopt;
}

absl::Status SqlGate::Screen(std::string_view sql) {
    if (absl::StripAsciiWhitespace(absl::string_view(sql.data(), sql.size())).empty()) {
        return absl::InvalidArgumentError("Empty query");
    }
    // Write attempts are reported as such whatever their length
    if (auto keyword = FindBlockedKeyword(sql)) {
        return MakeError(ErrorCode::kBlockedQuery,
                         absl::StrCat("Write operations blocked: ", *keyword));
    }
    if (sql.size() > kMaxQueryLength) {
        return absl::InvalidArgumentError(
            absl::StrCat("Query exceeds maximum length of ", kMaxQueryLength));
    }
    return absl::OkStatus();
}

absl::StatusOr<SqlResult> SqlGate::Run(const std::string& sql) {
    auto screened = Screen(sql);
    if (!screened.ok()) {
        WCOPT_LOG_WARN("Rejected query '{}': {}", SanitizeForLogging(sql.substr(0, 200)),
                       screened.ToString());
        return screened;
    }

    WCOPT_ASSIGN_OR_RETURN(storage::QueryResult result, store_.QueryReadOnly(sql, row_cap_));
    WCOPT_LOG_DEBUG("Ad-hoc query returned {} rows in {} ms", result.total_rows,
                    result.execution_time.count());

    SqlResult out;
    out.rows = result.total_rows;
    out.columns = std::move(result.table.columns);
    out.data = std::move(result.table.rows);
    if (out.data.size() > row_cap_) {
        out.data.resize(row_cap_);
    }
    return out;
}

std::string SqlGate::SanitizeForLogging(std::string_view value) {
    std::string result;
    result.reserve(value.size());

    for (char c : value) {
        switch (c) {
            case '\'': result += "\\'"; break;
            case '\\': result += "\\\\"; break;
            case '\0': result += "\\0"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (std::isprint(static_cast<unsigned char>(c))) {
                    result += c;
                } else {
                    result += '?';
                }
        }
    }
    return result;
}

}  // namespace wcopt::query
