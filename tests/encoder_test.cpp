#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "toon_encoder.h"
#include "toon_errors.h"

using namespace toontab;

namespace {

Document employees() {
    Document doc;
    doc.table_name = "employees";
    doc.columns = {"name", "department", "salary"};
    doc.rows = {
        {Value::make_string("Alice"), Value::make_string("Engineering"), Value::make_double(95000.0)},
        {Value::make_string("Bob"), Value::make_string("Marketing"), Value::make_double(75000.0)},
    };
    return doc;
}

} // namespace

TEST(EncoderTest, EmployeesTable) {
    EXPECT_EQ(serialize(employees()),
              "@employees\n"
              "name|department|salary\n"
              "---\n"
              "Alice|Engineering|95000.0\n"
              "Bob|Marketing|75000.0");
}

TEST(EncoderTest, NoTrailingNewline) {
    std::string out = serialize(employees());
    ASSERT_FALSE(out.empty());
    EXPECT_NE(out.back(), '\n');
}

TEST(EncoderTest, TableNameOmittedWhenAbsentOrEmpty) {
    Document doc = employees();
    doc.table_name.reset();
    EXPECT_EQ(serialize(doc).rfind("name|department|salary\n---\n", 0), 0u);

    doc.table_name = "";
    EXPECT_EQ(serialize(doc).rfind("name|department|salary\n---\n", 0), 0u);
}

TEST(EncoderTest, ZeroRows) {
    Document doc;
    doc.columns = {"a", "b"};
    EXPECT_EQ(serialize(doc), "a|b\n---");
}

TEST(EncoderTest, ScalarRendering) {
    Document doc;
    doc.columns = {"n", "b", "i", "d", "nan", "s"};
    doc.rows = {{Value::make_null(), Value::make_bool(false), Value::make_int(-3),
                 Value::make_double(1e16), Value::make_double(std::nan("")),
                 Value::make_string("New York")}};

    EXPECT_EQ(serialize(doc), "n|b|i|d|nan|s\n---\n|false|-3|1e+16||New York");
}

TEST(EncoderTest, StrictArity) {
    Document doc;
    doc.columns = {"a", "b"};
    doc.rows = {{Value::make_int(1), Value::make_int(2)}, {Value::make_int(3)}};

    try {
        serialize(doc);
        FAIL() << "expected EncodeError";
    } catch (const EncodeError& e) {
        EXPECT_EQ(e.type(), ErrorType::ARITY_MISMATCH);
        EXPECT_STREQ(e.what(), "Row 1 has 1 values but the header has 2 columns");
    }
}

TEST(EncoderTest, NonStrictWritesRowsAsGiven) {
    Document doc;
    doc.columns = {"a", "b"};
    doc.rows = {{Value::make_int(1)}, {Value::make_int(2), Value::make_int(3), Value::make_int(4)}};

    EncodeOptions opts;
    opts.strict = false;
    Encoder encoder(opts);
    EXPECT_EQ(encoder.encode(doc), "a|b\n---\n1\n2|3|4");
}

TEST(EncoderTest, StringsVerbatimByDefault) {
    Document doc;
    doc.columns = {"s"};
    doc.rows = {{Value::make_string("30")}, {Value::make_string("a|b")}};

    // Lossy: neither string survives a re-parse unchanged
    EXPECT_EQ(serialize(doc), "s\n---\n30\na|b");
}

TEST(EncoderTest, QuoteStringsOnlyWhenNeeded) {
    Document doc;
    doc.columns = {"s"};
    doc.rows = {
        {Value::make_string("plain")},
        {Value::make_string("30")},
        {Value::make_string("null")},
        {Value::make_string("True")},
        {Value::make_string("")},
        {Value::make_string(" pad")},
        {Value::make_string("a|b")},
        {Value::make_string("say \"hi\"")},
        {Value::make_string("two\nlines")},
        {Value::make_int(30)},
    };

    EncodeOptions opts;
    opts.quote_strings = true;
    Encoder encoder(opts);

    EXPECT_EQ(encoder.encode(doc),
              "s\n---\n"
              "plain\n"
              "\"30\"\n"
              "\"null\"\n"
              "\"True\"\n"
              "\"\"\n"
              "\" pad\"\n"
              "\"a|b\"\n"
              "\"say \\\"hi\\\"\"\n"
              "\"two\\nlines\"\n"
              "30");
}

TEST(EncoderTest, CustomMarkers) {
    EncodeOptions opts;
    opts.delimiter = ';';
    opts.name_marker = '#';
    opts.separator = "===";
    Encoder encoder(opts);

    EXPECT_EQ(encoder.encode(employees()),
              "#employees\n"
              "name;department;salary\n"
              "===\n"
              "Alice;Engineering;95000.0\n"
              "Bob;Marketing;75000.0");
}

TEST(EncoderTest, EncoderReusable) {
    Encoder encoder;
    std::string first = encoder.encode(employees());
    std::string second = encoder.encode(employees());
    EXPECT_EQ(first, second);
}

TEST(EncoderTest, NoColumnsStillWritesSeparator) {
    Document doc;
    EXPECT_EQ(serialize(doc), "\n---");
}
