#include "security/query_validator.hpp"
#include "parser/sql_scanner.hpp"

#include <cctype>
#include <format>

namespace sqlgate {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

constexpr const char* kNotReadQuery =
    "Not a read query: query must start with SELECT or WITH. "
    "Only read-only queries are allowed.";

} // anonymous namespace

QueryValidator::QueryValidator(Config config)
    : config_(std::move(config)) {}

std::string_view QueryValidator::prohibited_keyword(std::string_view word) {
    for (const auto keyword : kProhibitedKeywords) {
        if (iequals(word, keyword)) return keyword;
    }
    return {};
}

Result<ValidatedQuery> QueryValidator::validate(std::string_view raw) const {
    if (config_.max_query_length > 0 && raw.size() > config_.max_query_length) {
        return Result<ValidatedQuery>::error(ErrorKind::VALIDATION_ERROR,
            std::format("Query length {} exceeds maximum of {} bytes",
                        raw.size(), config_.max_query_length));
    }

    // Pass 1
    const std::string stripped = SqlScanner::strip(raw);

    // Pass 2
    const auto words = SqlScanner::words(stripped);

    // Shape: nothing but whitespace may precede the leading SELECT/WITH
    const size_t first_non_space = stripped.find_first_not_of(" \t\n\r\f\v");
    if (words.empty() || first_non_space == std::string::npos ||
        words.front().offset != first_non_space ||
        !(iequals(words.front().text, "SELECT") || iequals(words.front().text, "WITH"))) {
        return Result<ValidatedQuery>::error(ErrorKind::VALIDATION_ERROR, kNotReadQuery);
    }

    for (const auto& word : words) {
        const auto keyword = prohibited_keyword(word.text);
        if (!keyword.empty()) {
            return Result<ValidatedQuery>::error(ErrorKind::VALIDATION_ERROR,
                std::format("Query contains prohibited keyword '{}'. "
                            "Only read-only queries are allowed.", keyword));
        }
    }

    return Result<ValidatedQuery>::ok(ValidatedQuery(std::string(raw)));
}

} // namespace sqlgate
