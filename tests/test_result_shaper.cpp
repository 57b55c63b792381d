#include <catch2/catch_test_macros.hpp>
#include "executor/result_shaper.hpp"

#include <limits>

using namespace sqlgate;

namespace {

DbResultSet make_raw(std::vector<std::string> cols, std::vector<Row> rows) {
    DbResultSet raw;
    raw.success = true;
    raw.column_names = std::move(cols);
    raw.rows = std::move(rows);
    return raw;
}

} // namespace

TEST_CASE("ResultShaper: count equals the number of rows returned", "[shaper]") {
    auto shaped = ResultShaper::shape(make_raw({"id", "name"}, {
        {int64_t{1}, std::string("alice")},
        {int64_t{2}, std::string("bob")},
    }));
    CHECK(shaped.columns == std::vector<std::string>{"id", "name"});
    CHECK(shaped.rows.size() == 2);
    CHECK(shaped.count == 2);
}

TEST_CASE("ResultShaper: empty result keeps its columns", "[shaper]") {
    auto shaped = ResultShaper::shape(make_raw({"id"}, {}));
    CHECK(shaped.columns.size() == 1);
    CHECK(shaped.count == 0);

    const auto j = ResultShaper::to_json(shaped);
    CHECK(j["rows"].is_array());
    CHECK(j["rows"].empty());
    CHECK(j["count"] == 0);
}

TEST_CASE("ResultShaper: cell JSON encoding", "[shaper]") {
    CHECK(ResultShaper::to_json(ScalarValue{Null{}}).is_null());
    CHECK(ResultShaper::to_json(ScalarValue{int64_t{42}}) == 42);
    CHECK(ResultShaper::to_json(ScalarValue{2.5}) == 2.5);
    CHECK(ResultShaper::to_json(ScalarValue{std::string("hi")}) == "hi");
    CHECK(ResultShaper::to_json(ScalarValue{Blob{0x01, 0x02, 0xff}}) == "AQL/");
    CHECK(ResultShaper::to_json(ScalarValue{std::numeric_limits<double>::infinity()}).is_null());
    CHECK(ResultShaper::to_json(ScalarValue{std::numeric_limits<double>::quiet_NaN()}).is_null());
}

TEST_CASE("ResultShaper: paged envelope echoes effective limit and offset", "[shaper]") {
    const PaginationConfig cfg;
    auto page = PageRequest::make(std::nullopt, 3, cfg);
    REQUIRE(page.is_ok());

    auto paged = ResultShaper::shape_page(make_raw({"id"}, {{int64_t{4}}}), page.value());
    const auto j = ResultShaper::to_json(paged);
    CHECK(j["columns"] == nlohmann::json::array({"id"}));
    CHECK(j["count"] == 1);
    CHECK(j["limit"] == 100);
    CHECK(j["offset"] == 3);
}

TEST_CASE("ResultShaper: table list envelope", "[shaper]") {
    auto names = ResultShaper::shape_name_list(make_raw({"name"}, {
        {std::string("users")}, {std::string("orders")},
    }));
    REQUIRE(names.size() == 2);

    const auto j = ResultShaper::to_json(names);
    CHECK(j["tables"] == nlohmann::json::array({"users", "orders"}));
    CHECK(j["count"] == 2);
}

TEST_CASE("ResultShaper: table info from catalog rows", "[shaper]") {
    auto info = ResultShaper::shape_table_info("users", make_raw(
        {"cid", "name", "type", "notnull", "dflt_value", "pk"}, {
            {int64_t{0}, std::string("id"), std::string("INTEGER"), int64_t{0}, Null{}, int64_t{1}},
            {int64_t{1}, std::string("email"), std::string("TEXT"), int64_t{1},
             std::string("'none'"), int64_t{0}},
            {int64_t{2}, std::string("misc"), std::string(""), int64_t{0}, Null{}, int64_t{0}},
        }));

    CHECK(info.table_name == "users");
    REQUIRE(info.column_count == 3);
    CHECK(info.columns[0].primary_key);
    CHECK_FALSE(info.columns[0].default_value.has_value());
    CHECK(info.columns[1].not_null);
    CHECK(info.columns[1].default_value == "'none'");
    CHECK(info.columns[2].type.empty());

    const auto j = ResultShaper::to_json(info);
    CHECK(j["table_name"] == "users");
    CHECK(j["column_count"] == 3);
    CHECK(j["columns"][0]["pk"] == true);
    CHECK(j["columns"][0]["default_value"].is_null());
    CHECK(j["columns"][1]["notnull"] == true);
    CHECK(j["columns"][1]["default_value"] == "'none'");
}

TEST_CASE("ResultShaper: composite primary key members are all flagged", "[shaper]") {
    auto info = ResultShaper::shape_table_info("pairs", make_raw(
        {"cid", "name", "type", "notnull", "dflt_value", "pk"}, {
            {int64_t{0}, std::string("a"), std::string("INT"), int64_t{0}, Null{}, int64_t{1}},
            {int64_t{1}, std::string("b"), std::string("INT"), int64_t{0}, Null{}, int64_t{2}},
        }));
    REQUIRE(info.columns.size() == 2);
    CHECK(info.columns[0].primary_key);
    CHECK(info.columns[1].primary_key);
}
