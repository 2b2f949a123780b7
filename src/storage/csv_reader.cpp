/// @file csv_reader.cpp
/// @brief RFC 4180 CSV parsing

#include "storage/csv_reader.h"

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace wcopt::storage {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

/// @brief Splits text into records of cells
class CsvTokenizer {
public:
    explicit CsvTokenizer(std::string_view text) : text_(text) {}

    bool AtEnd() const { return pos_ >= text_.size(); }
    size_t Line() const { return line_; }

    /// @brief Next record; fails on an unterminated quote or stray characters
    /// after a closing quote
    absl::StatusOr<Row> NextRecord() {
        Row record;
        while (true) {
            Cell cell;
            if (pos_ < text_.size() && text_[pos_] == '"') {
                auto quoted = QuotedField();
                if (!quoted.ok()) {
                    return quoted.status();
                }
                cell = std::move(quoted).value();
            } else {
                cell = PlainField();
            }
            record.push_back(std::move(cell));

            if (pos_ >= text_.size()) {
                return record;
            }
            const char c = text_[pos_];
            if (c == ',') {
                ++pos_;
                continue;
            }
            if (c == '\r' && pos_ + 1 < text_.size() && text_[pos_ + 1] == '\n') {
                pos_ += 2;
            } else if (c == '\n' || c == '\r') {
                ++pos_;
            } else {
                return absl::InvalidArgumentError(absl::StrCat(
                    "Unexpected character after closing quote on line ", line_));
            }
            ++line_;
            return record;
        }
    }

private:
    Cell PlainField() {
        const size_t start = pos_;
        while (pos_ < text_.size() && text_[pos_] != ',' && text_[pos_] != '\n' &&
               text_[pos_] != '\r') {
            ++pos_;
        }
        if (pos_ == start) {
            return std::nullopt;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    absl::StatusOr<Cell> QuotedField() {
        const size_t opened_on = line_;
        ++pos_;  // opening quote
        std::string value;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '"') {
                if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '"') {
                    value += '"';
                    pos_ += 2;
                    continue;
                }
                ++pos_;  // closing quote
                return Cell(std::move(value));
            }
            if (c == '\n') {
                ++line_;
            }
            value += c;
            ++pos_;
        }
        return absl::InvalidArgumentError(
            absl::StrCat("Unterminated quoted field starting on line ", opened_on));
    }

    std::string_view text_;
    size_t pos_ = 0;
    size_t line_ = 1;
};

/// @brief Offset of the first byte that does not belong to a well-formed
/// UTF-8 sequence, or nullopt when the whole text is valid
std::optional<size_t> FindInvalidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                low = 0xA0;  // overlong
            } else if (lead == 0xED) {
                high = 0x9F;  // surrogates
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                low = 0x90;
            } else if (lead == 0xF4) {
                high = 0x8F;  // above U+10FFFF
            }
        } else {
            return i;
        }
        if (i + length > text.size()) {
            return i;
        }
        for (size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            const unsigned char lo = k == 1 ? low : 0x80;
            const unsigned char hi = k == 1 ? high : 0xBF;
            if (next < lo || next > hi) {
                return i;
            }
        }
        i += length;
    }
    return std::nullopt;
}

bool IsEmptyRecord(const Row& record) {
    return record.size() == 1 && !record[0].has_value();
}

}  // namespace

absl::StatusOr<Table> ParseCsv(std::string_view text) {
    if (absl::StartsWith(absl::string_view(text.data(), text.size()), absl::string_view(kUtf8Bom.data(), kUtf8Bom.size()))) {
        text.remove_prefix(kUtf8Bom.size());
    }
    if (auto offset = FindInvalidUtf8(text)) {
        const size_t line = 1 + std::count(text.begin(), text.begin() + *offset, '\n');
        return absl::InvalidArgumentError(
            absl::StrCat("Line ", line, " is not valid UTF-8"));
    }

    CsvTokenizer tokenizer(text);
    Table table;
    bool have_header = false;
    while (!tokenizer.AtEnd()) {
        const size_t line = tokenizer.Line();
        auto record = tokenizer.NextRecord();
        if (!record.ok()) {
            return record.status();
        }
        if (IsEmptyRecord(*record)) {
            continue;
        }

        if (!have_header) {
            for (auto& cell : *record) {
                table.columns.push_back(cell.value_or(""));
            }
            have_header = true;
            continue;
        }

        if (record->size() > table.columns.size()) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Line ", line, " has ", record->size(), " fields, header has ",
                table.columns.size()));
        }
        record->resize(table.columns.size());
        table.rows.push_back(std::move(record).value());
    }

    if (!have_header) {
        return absl::InvalidArgumentError("CSV input has no header row");
    }
    return table;
}

absl::StatusOr<Table> ReadCsvFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return absl::NotFoundError(absl::StrCat("Cannot open ", path.string()));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return absl::InternalError(absl::StrCat("Failed to read ", path.string()));
    }
    return ParseCsv(contents.str());
}

}  // namespace wcopt::storage
