#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

namespace sqlgate {

/**
 * @brief A table name that matches ^[A-Za-z0-9_]+$
 *
 * Identifiers cannot be bound as parameters, so this is the only value the
 * pipeline interpolates into SQL text. The allowlist is the whole defence;
 * there is no denylist of dangerous characters.
 *
 * Only sanitize() can construct one.
 */
class TableName {
public:
    [[nodiscard]] const std::string& str() const { return name_; }

    /**
     * @brief Identifier wrapped in double quotes, ready for interpolation
     */
    [[nodiscard]] std::string quoted() const { return "\"" + name_ + "\""; }

    bool operator==(const TableName&) const = default;

private:
    friend Result<TableName> sanitize(std::string_view name);

    explicit TableName(std::string name) : name_(std::move(name)) {}

    std::string name_;
};

/**
 * @brief Validate a caller-supplied table name
 * @return TableName, or VALIDATION_ERROR naming the rejected input
 *
 * No length cap beyond what SQLite enforces.
 */
[[nodiscard]] Result<TableName> sanitize(std::string_view name);

/**
 * @brief Character test used by sanitize(): [A-Za-z0-9_]
 */
[[nodiscard]] constexpr bool is_identifier_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_';
}

} // namespace sqlgate
