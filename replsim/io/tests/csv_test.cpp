#include <replsim/io/csv.hpp>
#include <replsim/io/error.hpp>

#include <gtest/gtest.h>

using namespace replsim::io;

class CsvTest : public ::testing::Test {};

// =============================================================================
// Parsing
// =============================================================================

TEST_F(CsvTest, ParsesPlainRows) {
    auto rows = parse_csv("a,b,c\n1,2,3\n");

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (CsvRow{"a", "b", "c"}));
    EXPECT_EQ(rows[1], (CsvRow{"1", "2", "3"}));
}

TEST_F(CsvTest, LastRowWithoutNewline) {
    auto rows = parse_csv("a,b\n1,2");

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (CsvRow{"1", "2"}));
}

TEST_F(CsvTest, QuotedFieldsKeepCommasAndQuotes) {
    auto rows = parse_csv("\"Mug, large\",\"say \"\"hi\"\"\"\n");

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0][0], "Mug, large");
    EXPECT_EQ(rows[0][1], "say \"hi\"");
}

TEST_F(CsvTest, QuotedFieldSpansLines) {
    auto rows = parse_csv("\"two\nlines\",x\n");

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0][0], "two\nlines");
}

TEST_F(CsvTest, CrLfAndBlankLines) {
    auto rows = parse_csv("a,b\r\n\r\n1,2\r\n\n");

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[1], (CsvRow{"1", "2"}));
}

TEST_F(CsvTest, SkipsByteOrderMark) {
    auto rows = parse_csv("\xEF\xBB\xBFproduct_title\nMug\n");

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][0], "product_title");
}

TEST_F(CsvTest, EmptyCellsArePreserved) {
    auto rows = parse_csv("a,,c\n");

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (CsvRow{"a", "", "c"}));
}

TEST_F(CsvTest, UnterminatedQuoteThrows) {
    try {
        (void)parse_csv("a,b\n\"open,1\n");
        FAIL() << "expected LoaderError";
    } catch (const LoaderError& e) {
        EXPECT_NE(std::string(e.what()).find("unterminated"), std::string::npos);
    }
}

// =============================================================================
// Writing
// =============================================================================

TEST_F(CsvTest, EscapeOnlyWhenNeeded) {
    EXPECT_EQ(escape_csv_field("plain"), "plain");
    EXPECT_EQ(escape_csv_field("a,b"), "\"a,b\"");
    EXPECT_EQ(escape_csv_field("a\"b"), "\"a\"\"b\"");
    EXPECT_EQ(escape_csv_field(""), "");
}

TEST_F(CsvTest, FormattedRowParsesBack) {
    CsvRow row{"Mug, large", "Blue", "say \"hi\"", ""};
    auto rows = parse_csv(format_csv_row(row) + "\n");

    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], row);
}
