#pragma once
/// @file csvFormatUtil.hpp
/// @brief Minimal-quoting CSV row formatting and document parsing

#include <string>
#include <system_error>
#include <vector>

namespace SkuMaster::util {

constexpr char kCsvDelimiter = ',';
constexpr char kCsvQuote = '"';
constexpr const char* kCsvLineTerminator = "\r\n";

/// @brief True when @p field must be wrapped in quotes to survive a round trip
inline bool needsQuoting(const std::string& field) {
    return field.find_first_of(",\"\r\n") != std::string::npos;
}

/// @brief Quote a single cell if needed, doubling embedded quotes
inline std::string escapeField(const std::string& field) {
    if (!needsQuoting(field))
        return field;

    std::string o;
    o.reserve(field.size() + 2);
    o.push_back(kCsvQuote);
    for (char c : field) {
        if (c == kCsvQuote)
            o.push_back(kCsvQuote);
        o.push_back(c);
    }
    o.push_back(kCsvQuote);
    return o;
}

/// @brief One physical CSV record including the trailing "\r\n"
inline std::string formatRow(const std::vector<std::string>& fields) {
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i != 0)
            out.push_back(kCsvDelimiter);
        out += escapeField(fields[i]);
    }
    out += kCsvLineTerminator;
    return out;
}

// 문서 전체를 한 번에 파싱한다.
// - quoted field 안의 개행은 레코드 경계가 아니므로 줄 단위 분할을 먼저 하면 안 된다.
// - 닫는 따옴표 뒤에 구분자가 아닌 문자가 오면 그대로 값에 이어 붙인다.
// - 완전히 빈 줄은 건너뛴다.
// - 파일 끝에서 따옴표가 닫히지 않았으면 invalid_argument로 실패한다.
inline bool parseDocument(const std::string& text, std::vector<std::vector<std::string>>& rows,
                          std::error_code& ec) {
    ec.clear();
    rows.clear();

    size_t i = 0;
    const size_t n = text.size();

    // Excel 등이 붙이는 UTF-8 BOM은 첫 헤더 이름의 일부가 되지 않도록 제거한다.
    if (n >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        i = 3;

    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool rowHasContent = false;

    auto endField = [&]() {
        row.push_back(std::move(field));
        field.clear();
    };
    auto endRow = [&]() {
        if (rowHasContent) {
            endField();
            rows.push_back(std::move(row));
        }
        row.clear();
        field.clear();
        rowHasContent = false;
    };

    while (i < n) {
        const char c = text[i++];

        if (inQuotes) {
            if (c == kCsvQuote) {
                if (i < n && text[i] == kCsvQuote) {
                    field.push_back(kCsvQuote);
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == kCsvDelimiter) {
            rowHasContent = true;
            endField();
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && i < n && text[i] == '\n')
                ++i;
            endRow();
        } else if (c == kCsvQuote && field.empty()) {
            rowHasContent = true;
            inQuotes = true;
        } else {
            rowHasContent = true;
            field.push_back(c);
        }
    }

    if (inQuotes) {
        rows.clear();
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    endRow();
    return true;
}

} // namespace SkuMaster::util
