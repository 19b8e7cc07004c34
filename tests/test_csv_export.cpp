#include <catch2/catch_test_macros.hpp>
#include "io/csv_export.hpp"
#include "mocks/temp_dir.hpp"

#include <sstream>

using namespace querydesk;
using namespace querydesk::testing;

namespace {

std::vector<std::string> read_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

} // namespace

TEST_CASE("CSV: export then read back", "[csv]") {
    TempDir dir;
    const auto written = export_csv({"id", "name"}, {Row{"1", "alice"}, Row{"2", "bob"}}, dir.file("people"));
    REQUIRE(written.is_ok());
    CHECK(written.value() == dir.file("people.csv"));

    auto text = TempDir::read(written.value());
    REQUIRE(text.starts_with("\xEF\xBB\xBF"));
    text.erase(0, 3);
    CHECK(text == "id,name\r\n1,alice\r\n2,bob\r\n");

    const auto lines = read_lines(text);
    REQUIRE(lines.size() == 3);
    CHECK(parse_csv_line(lines[0]) == std::vector<std::string>{"id", "name"});
    CHECK(parse_csv_line(lines[1]) == std::vector<std::string>{"1", "alice"});
    CHECK(parse_csv_line(lines[2]) == std::vector<std::string>{"2", "bob"});
}

TEST_CASE("CSV: quoting and NULLs", "[csv]") {
    CHECK(csv_escape("plain") == "plain");
    CHECK(csv_escape("a,b") == "\"a,b\"");
    CHECK(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    CHECK(csv_escape("two\nlines") == "\"two\nlines\"");
    CHECK(csv_escape("a;b", ';') == "\"a;b\"");
    CHECK(csv_escape("a,b", ';') == "a,b");

    CHECK(parse_csv_line("\"a,b\",\"say \"\"hi\"\"\",,x\r") ==
          std::vector<std::string>{"a,b", "say \"hi\"", "", "x"});

    TempDir dir;
    const auto written = export_csv({"k", "v"}, {Row{"1", std::nullopt}}, dir.file("nulls.CSV"),
                                    CsvOptions{true, ',', false});
    REQUIRE(written.is_ok());
    CHECK(written.value() == dir.file("nulls.CSV"));
    CHECK(TempDir::read(written.value()) == "k,v\r\n1,\r\n");
}

TEST_CASE("CSV: options", "[csv]") {
    TempDir dir;
    CsvOptions options;
    options.include_header = false;
    options.delimiter = ';';
    options.utf8_bom = false;

    const auto written = export_csv({"a", "b"}, {Row{"x;y", "z"}}, dir.file("out.csv"), options);
    REQUIRE(written.is_ok());
    CHECK(TempDir::read(written.value()) == "\"x;y\";z\r\n");
}

TEST_CASE("CSV: unwritable destination", "[csv]") {
    TempDir dir;
    const auto written = export_csv({"a"}, {}, dir.file("missing/dir/out.csv"));
    REQUIRE(written.is_error());
    CHECK(written.error_category() == ErrorCategory::INTERNAL_ERROR);
}
