#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "toon_charconv.h"
#include "toon_infer.h"

using namespace toontab;

TEST(InferTest, NullKeywordsAnyCase) {
    for (const char* token : {"", "   ", "null", "NULL", "Null", "none", "None",
                              "na", "NA", "nan", "NaN", "  null  "}) {
        EXPECT_EQ(infer_value(token), Value::make_null()) << "token: '" << token << "'";
    }
}

TEST(InferTest, BooleansAnyCase) {
    EXPECT_EQ(infer_value("true"), Value::make_bool(true));
    EXPECT_EQ(infer_value("True"), Value::make_bool(true));
    EXPECT_EQ(infer_value("TRUE"), Value::make_bool(true));
    EXPECT_EQ(infer_value("false"), Value::make_bool(false));
    EXPECT_EQ(infer_value("FALSE"), Value::make_bool(false));
    EXPECT_EQ(infer_value(" False "), Value::make_bool(false));
}

TEST(InferTest, Integers) {
    EXPECT_EQ(infer_value("30"), Value::make_int(30));
    EXPECT_EQ(infer_value("-7"), Value::make_int(-7));
    EXPECT_EQ(infer_value("+12"), Value::make_int(12));
    EXPECT_EQ(infer_value("007"), Value::make_int(7));
    EXPECT_EQ(infer_value("0"), Value::make_int(0));
    EXPECT_EQ(infer_value("9223372036854775807"),
              Value::make_int(std::numeric_limits<int64_t>::max()));
    EXPECT_EQ(infer_value("-9223372036854775808"),
              Value::make_int(std::numeric_limits<int64_t>::min()));
}

TEST(InferTest, IntegerOverflowBecomesDouble) {
    Value v = infer_value("99999999999999999999");
    ASSERT_EQ(v.kind(), ValueKind::V_DOUBLE);
    EXPECT_DOUBLE_EQ(v.double_val(), 1e20);

    Value neg = infer_value("-99999999999999999999");
    ASSERT_EQ(neg.kind(), ValueKind::V_DOUBLE);
    EXPECT_DOUBLE_EQ(neg.double_val(), -1e20);
}

TEST(InferTest, Doubles) {
    EXPECT_EQ(infer_value("30.0"), Value::make_double(30.0));
    EXPECT_EQ(infer_value("3e2"), Value::make_double(300.0));
    EXPECT_EQ(infer_value("1E5"), Value::make_double(100000.0));
    EXPECT_EQ(infer_value(".5"), Value::make_double(0.5));
    EXPECT_EQ(infer_value("5."), Value::make_double(5.0));
    EXPECT_EQ(infer_value("-2.5e-3"), Value::make_double(-0.0025));
    EXPECT_EQ(infer_value("+1.5"), Value::make_double(1.5));
    EXPECT_EQ(infer_value("95000.0"), Value::make_double(95000.0));
}

TEST(InferTest, UnderflowBecomesSignedZero) {
    Value tiny = infer_value("1e-400");
    ASSERT_EQ(tiny.kind(), ValueKind::V_DOUBLE);
    EXPECT_EQ(tiny.double_val(), 0.0);
    EXPECT_FALSE(std::signbit(tiny.double_val()));

    Value neg = infer_value("-1e-400");
    ASSERT_EQ(neg.kind(), ValueKind::V_DOUBLE);
    EXPECT_EQ(neg.double_val(), 0.0);
    EXPECT_TRUE(std::signbit(neg.double_val()));

    Value long_fraction = infer_value("0." + std::string(400, '0') + "1");
    ASSERT_EQ(long_fraction.kind(), ValueKind::V_DOUBLE);
    EXPECT_EQ(long_fraction.double_val(), 0.0);

    EXPECT_EQ(infer_value("+2.5E-999"), Value::make_double(0.0));
    EXPECT_EQ(render_value(infer_value("-1e-400")), "-0.0");
}

TEST(InferTest, SubnormalsKeepTheirValue) {
    EXPECT_EQ(infer_value("5e-324"), Value::make_double(5e-324));
    EXPECT_EQ(infer_value("1e-310"), Value::make_double(1e-310));
}

TEST(InferTest, FallsBackToString) {
    for (const char* token : {"Alice", "New York", "1.2.3", "1e", "e5", "inf",
                              "Infinity", "0x10", "--5", "+-5", "12abc",
                              "trueish", "-", "+", ".", "1e400", "1_000"}) {
        Value v = infer_value(token);
        ASSERT_EQ(v.kind(), ValueKind::V_STRING) << "token: '" << token << "'";
        EXPECT_EQ(v.string_val(), token);
    }
}

TEST(InferTest, StringKeepsCaseAndInteriorSpace) {
    EXPECT_EQ(infer_value("  Alice  Smith \t"), Value::make_string("Alice  Smith"));
    EXPECT_EQ(infer_value("Hello"), Value::make_string("Hello"));
}

TEST(InferTest, PrimitiveRecognisers) {
    EXPECT_TRUE(parse_null("None"));
    EXPECT_FALSE(parse_null("nil"));
    EXPECT_EQ(parse_bool("TRUE"), std::optional<bool>(true));
    EXPECT_FALSE(parse_bool("yes").has_value());
    EXPECT_EQ(parse_integer("42"), std::optional<int64_t>(42));
    EXPECT_FALSE(parse_integer("42.0").has_value());
    EXPECT_FALSE(parse_integer("4e2").has_value());
    EXPECT_EQ(parse_number("4e2"), std::optional<double>(400.0));
    EXPECT_FALSE(parse_number("4e2x").has_value());
}

TEST(InferTest, TrimAndIequals) {
    EXPECT_EQ(trim("  a b \r\n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_TRUE(iequals("NuLl", "null"));
    EXPECT_FALSE(iequals("nul", "null"));
}

TEST(RenderTest, Scalars) {
    EXPECT_EQ(render_value(Value::make_null()), "");
    EXPECT_EQ(render_value(Value::make_bool(true)), "true");
    EXPECT_EQ(render_value(Value::make_bool(false)), "false");
    EXPECT_EQ(render_value(Value::make_int(-42)), "-42");
    EXPECT_EQ(render_value(Value::make_string("Alice Smith")), "Alice Smith");
}

TEST(RenderTest, NaNRendersEmpty) {
    EXPECT_EQ(render_value(Value::make_double(std::nan(""))), "");
}

TEST(RenderTest, DoubleForms) {
    EXPECT_EQ(render_value(Value::make_double(95000.0)), "95000.0");
    EXPECT_EQ(render_value(Value::make_double(30.0)), "30.0");
    EXPECT_EQ(render_value(Value::make_double(0.0)), "0.0");
    EXPECT_EQ(render_value(Value::make_double(-0.0)), "-0.0");
    EXPECT_EQ(render_value(Value::make_double(0.1)), "0.1");
    EXPECT_EQ(render_value(Value::make_double(-2.5)), "-2.5");
    EXPECT_EQ(render_value(Value::make_double(1.0 / 3.0)), "0.3333333333333333");
    EXPECT_EQ(render_value(Value::make_double(0.0001)), "0.0001");
    EXPECT_EQ(render_value(Value::make_double(1.5e-05)), "1.5e-05");
    EXPECT_EQ(render_value(Value::make_double(1e15)), "1000000000000000.0");
    EXPECT_EQ(render_value(Value::make_double(123456789012345.6)), "123456789012345.6");
    EXPECT_EQ(render_value(Value::make_double(1e16)), "1e+16");
    EXPECT_EQ(render_value(Value::make_double(2.5e100)), "2.5e+100");
    EXPECT_EQ(render_value(Value::make_double(1e-100)), "1e-100");
}

TEST(RenderTest, Infinity) {
    EXPECT_EQ(format_double(std::numeric_limits<double>::infinity()), "inf");
    EXPECT_EQ(format_double(-std::numeric_limits<double>::infinity()), "-inf");
}

TEST(InferTest, IdempotentThroughRender) {
    const std::vector<std::string> tokens = {
        "", "NULL", "none", "True", "false", "30", "-7", "+12", "30.0", "3e2",
        "1E5", ".5", "0.1", "-2.5e-3", "1e16", "1.5e-05", "123456789012345.6",
        "99999999999999999999", "9223372036854775807"};

    for (const auto& s : tokens) {
        Value first = infer_value(s);
        ASSERT_NE(first.kind(), ValueKind::V_STRING) << s;
        EXPECT_EQ(infer_value(render_value(first)), first) << s;
    }
}
