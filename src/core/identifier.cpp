#include "core/identifier.hpp"

#include <algorithm>
#include <format>

namespace sqlgate {

Result<TableName> sanitize(std::string_view name) {
    if (name.empty()) {
        return Result<TableName>::error(ErrorKind::VALIDATION_ERROR,
            "Invalid table name: name must not be empty");
    }

    if (!std::all_of(name.begin(), name.end(), is_identifier_char)) {
        return Result<TableName>::error(ErrorKind::VALIDATION_ERROR,
            std::format("Invalid table name '{}': only alphanumeric characters and "
                        "underscores are allowed", name));
    }

    return Result<TableName>::ok(TableName(std::string(name)));
}

} // namespace sqlgate
