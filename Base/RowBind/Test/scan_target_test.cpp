#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTimeZone>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "rowbind/scan_target.h"

namespace rowbind {

    using namespace std::chrono;

    TEST(ScanTargetTest, IntegerAcceptsFittingIntegers) {
        int16_t small = 0;
        ASSERT_FALSE(ScanTarget(&small).assign(SqlValue(int64_t{-32768})));
        EXPECT_EQ(small, -32768);
        ASSERT_FALSE(ScanTarget(&small).assign(SqlValue(uint8_t{200})));
        EXPECT_EQ(small, 200);

        uint64_t big = 0;
        ASSERT_FALSE(ScanTarget(&big).assign(SqlValue(std::numeric_limits<uint64_t>::max())));
        EXPECT_EQ(big, std::numeric_limits<uint64_t>::max());
    }

    TEST(ScanTargetTest, IntegerRejectsOutOfRange) {
        int8_t tiny = 5;
        Error err = ScanTarget(&tiny).assign(SqlValue(int32_t{128}));
        EXPECT_EQ(err.code, ErrorCode::ScanError);
        EXPECT_NE(err.message.find("out of range"), std::string::npos);
        EXPECT_EQ(tiny, 5);

        uint32_t unsigned_field = 1;
        EXPECT_TRUE(ScanTarget(&unsigned_field).assign(SqlValue(int64_t{-1})));
        EXPECT_EQ(unsigned_field, 1u);

        int64_t wide = 0;
        EXPECT_TRUE(ScanTarget(&wide).assign(SqlValue(std::numeric_limits<uint64_t>::max())));
    }

    TEST(ScanTargetTest, IntegerFromBool) {
        int32_t value = 9;
        ASSERT_FALSE(ScanTarget(&value).assign(SqlValue(true)));
        EXPECT_EQ(value, 1);
        ASSERT_FALSE(ScanTarget(&value).assign(SqlValue(false)));
        EXPECT_EQ(value, 0);
    }

    TEST(ScanTargetTest, IntegerFromFloatingOnlyWhenIntegral) {
        int32_t value = 0;
        ASSERT_FALSE(ScanTarget(&value).assign(SqlValue(42.0)));
        EXPECT_EQ(value, 42);
        EXPECT_TRUE(ScanTarget(&value).assign(SqlValue(42.5)));
        EXPECT_TRUE(ScanTarget(&value).assign(SqlValue(std::nan(""))));
        EXPECT_TRUE(ScanTarget(&value).assign(SqlValue(4294967296.0)));
        EXPECT_EQ(value, 42);

        uint8_t byte = 0;
        ASSERT_FALSE(ScanTarget(&byte).assign(SqlValue(255.0f)));
        EXPECT_EQ(byte, 255);
        EXPECT_TRUE(ScanTarget(&byte).assign(SqlValue(256.0f)));
    }

    TEST(ScanTargetTest, IntegerFromString) {
        int64_t value = 0;
        ASSERT_FALSE(ScanTarget(&value).assign(SqlValue("-9000000000")));
        EXPECT_EQ(value, int64_t{-9000000000});

        EXPECT_TRUE(ScanTarget(&value).assign(SqlValue("12abc")));
        EXPECT_TRUE(ScanTarget(&value).assign(SqlValue("")));
        EXPECT_TRUE(ScanTarget(&value).assign(SqlValue(" 12")));

        int8_t tiny = 0;
        Error err = ScanTarget(&tiny).assign(SqlValue("300"));
        EXPECT_EQ(err.code, ErrorCode::ScanError);
        EXPECT_NE(err.message.find("out of range"), std::string::npos);
    }

    TEST(ScanTargetTest, IntegerRejectsTemporalAndBytes) {
        int32_t value = 0;
        EXPECT_TRUE(ScanTarget(&value).assign(SqlValue(year{2024} / 1 / 2)));
        EXPECT_TRUE(ScanTarget(&value).assign(SqlValue(std::vector<unsigned char>{1, 2})));
    }

    TEST(ScanTargetTest, FloatingAcceptsNumbersAndStrings) {
        double d = 0;
        ASSERT_FALSE(ScanTarget(&d).assign(SqlValue(int32_t{-3})));
        EXPECT_DOUBLE_EQ(d, -3.0);
        ASSERT_FALSE(ScanTarget(&d).assign(SqlValue(1.5f)));
        EXPECT_DOUBLE_EQ(d, 1.5);
        ASSERT_FALSE(ScanTarget(&d).assign(SqlValue("2.75")));
        EXPECT_DOUBLE_EQ(d, 2.75);
        EXPECT_TRUE(ScanTarget(&d).assign(SqlValue("2.75 ")));
        EXPECT_TRUE(ScanTarget(&d).assign(SqlValue(true)));

        float f = 0;
        ASSERT_FALSE(ScanTarget(&f).assign(SqlValue(0.25)));
        EXPECT_FLOAT_EQ(f, 0.25f);
    }

    TEST(ScanTargetTest, BoolAcceptsBoolIntegersAndWords) {
        bool flag = false;
        ASSERT_FALSE(ScanTarget(&flag).assign(SqlValue(int8_t{1})));
        EXPECT_TRUE(flag);
        ASSERT_FALSE(ScanTarget(&flag).assign(SqlValue(uint64_t{0})));
        EXPECT_FALSE(flag);
        EXPECT_TRUE(ScanTarget(&flag).assign(SqlValue(int32_t{2})));

        ASSERT_FALSE(ScanTarget(&flag).assign(SqlValue("TRUE")));
        EXPECT_TRUE(flag);
        ASSERT_FALSE(ScanTarget(&flag).assign(SqlValue("f")));
        EXPECT_FALSE(flag);
        ASSERT_FALSE(ScanTarget(&flag).assign(SqlValue("1")));
        EXPECT_TRUE(flag);
        EXPECT_TRUE(ScanTarget(&flag).assign(SqlValue("yes")));
        EXPECT_TRUE(ScanTarget(&flag).assign(SqlValue(1.0)));
    }

    TEST(ScanTargetTest, StringAcceptsTextOfAnyScalar) {
        std::string s;
        ASSERT_FALSE(ScanTarget(&s).assign(SqlValue("hello")));
        EXPECT_EQ(s, "hello");
        ASSERT_FALSE(ScanTarget(&s).assign(SqlValue(std::vector<unsigned char>{'a', 'b', 'c'})));
        EXPECT_EQ(s, "abc");
        ASSERT_FALSE(ScanTarget(&s).assign(SqlValue(int64_t{-12})));
        EXPECT_EQ(s, "-12");
        ASSERT_FALSE(ScanTarget(&s).assign(SqlValue(true)));
        EXPECT_EQ(s, "true");
        ASSERT_FALSE(ScanTarget(&s).assign(SqlValue(0.5)));
        EXPECT_EQ(s, "0.5");
        ASSERT_FALSE(ScanTarget(&s).assign(SqlValue(year{2024} / 2 / 29)));
        EXPECT_EQ(s, "2024-02-29");
        ASSERT_FALSE(ScanTarget(&s).assign(SqlValue(-(hours(838) + minutes(59) + seconds(59)))));
        EXPECT_EQ(s, "-838:59:59");
        ASSERT_FALSE(ScanTarget(&s).assign(SqlValue(SqlValue::ChronoDateTime(sys_days(year{2023} / 12 / 31) + hours(23) + minutes(59) + seconds(58) + milliseconds(125)))));
        EXPECT_EQ(s, "2023-12-31 23:59:58.125000");

        QString qs;
        ASSERT_FALSE(ScanTarget(&qs).assign(SqlValue("grüße")));
        EXPECT_EQ(qs, QString::fromUtf8("grüße"));
    }

    TEST(ScanTargetTest, BytesAcceptBytesAndStrings) {
        std::vector<unsigned char> bytes;
        ASSERT_FALSE(ScanTarget(&bytes).assign(SqlValue("xy")));
        EXPECT_EQ(bytes, (std::vector<unsigned char>{'x', 'y'}));
        ASSERT_FALSE(ScanTarget(&bytes).assign(SqlValue(std::vector<unsigned char>{0x00, 0xff})));
        EXPECT_EQ(bytes, (std::vector<unsigned char>{0x00, 0xff}));
        EXPECT_TRUE(ScanTarget(&bytes).assign(SqlValue(int32_t{1})));

        QByteArray qbytes;
        ASSERT_FALSE(ScanTarget(&qbytes).assign(SqlValue(std::vector<unsigned char>{0x01, 0x02, 0x03})));
        EXPECT_EQ(qbytes, QByteArray("\x01\x02\x03", 3));
    }

    TEST(ScanTargetTest, DateConversions) {
        SqlValue::ChronoDate date;
        ASSERT_FALSE(ScanTarget(&date).assign(SqlValue("2024-02-29")));
        EXPECT_EQ(date, year{2024} / 2 / 29);
        EXPECT_TRUE(ScanTarget(&date).assign(SqlValue("2023-02-29")));
        EXPECT_TRUE(ScanTarget(&date).assign(SqlValue("2024/02/01")));

        ASSERT_FALSE(ScanTarget(&date).assign(SqlValue(SqlValue::ChronoDateTime(sys_days(year{2020} / 5 / 17) + hours(22)))));
        EXPECT_EQ(date, year{2020} / 5 / 17);

        QDate qdate;
        ASSERT_FALSE(ScanTarget(&qdate).assign(SqlValue(year{1999} / 12 / 31)));
        EXPECT_EQ(qdate, QDate(1999, 12, 31));
    }

    TEST(ScanTargetTest, DateTimeConversions) {
        SqlValue::ChronoDateTime dt;
        ASSERT_FALSE(ScanTarget(&dt).assign(SqlValue("2024-03-01 09:15:00.25")));
        EXPECT_EQ(dt, sys_days(year{2024} / 3 / 1) + hours(9) + minutes(15) + milliseconds(250));
        ASSERT_FALSE(ScanTarget(&dt).assign(SqlValue("2024-03-01T09:15:00Z")));
        EXPECT_EQ(dt, sys_days(year{2024} / 3 / 1) + hours(9) + minutes(15));
        ASSERT_FALSE(ScanTarget(&dt).assign(SqlValue("2024-03-01")));
        EXPECT_EQ(dt, sys_days(year{2024} / 3 / 1));
        ASSERT_FALSE(ScanTarget(&dt).assign(SqlValue(year{2000} / 1 / 1)));
        EXPECT_EQ(dt, sys_days(year{2000} / 1 / 1));
        EXPECT_TRUE(ScanTarget(&dt).assign(SqlValue("2024-03-01 24:00:00")));
        EXPECT_TRUE(ScanTarget(&dt).assign(SqlValue("2024-03-01 09:15")));
        EXPECT_TRUE(ScanTarget(&dt).assign(SqlValue("2024-03-01 09:15:00.1234567")));

        QDateTime qdt;
        ASSERT_FALSE(ScanTarget(&qdt).assign(SqlValue(SqlValue::ChronoDateTime(sys_days(year{2024} / 3 / 1) + hours(9) + milliseconds(7)))));
        EXPECT_EQ(qdt, QDateTime(QDate(2024, 3, 1), QTime(9, 0, 0, 7), QTimeZone::utc()));
    }

    TEST(ScanTargetTest, TimeConversions) {
        SqlValue::ChronoTime t;
        ASSERT_FALSE(ScanTarget(&t).assign(SqlValue("-12:30:00.5")));
        EXPECT_EQ(t, -(hours(12) + minutes(30) + milliseconds(500)));
        ASSERT_FALSE(ScanTarget(&t).assign(SqlValue("100:00:01")));
        EXPECT_EQ(t, hours(100) + seconds(1));
        EXPECT_TRUE(ScanTarget(&t).assign(SqlValue("10:60:00")));
        EXPECT_TRUE(ScanTarget(&t).assign(SqlValue(year{2024} / 1 / 1)));
    }

    TEST(ScanTargetTest, NullHandling) {
        std::string s = "keep";
        Error err = ScanTarget(&s).assign(SqlValue());
        EXPECT_EQ(err.code, ErrorCode::ScanError);
        EXPECT_NE(err.message.find("cannot scan NULL into std::string"), std::string::npos);
        EXPECT_EQ(s, "keep");

        std::optional<int64_t> maybe = 5;
        ASSERT_FALSE(ScanTarget(&maybe).assign(SqlValue()));
        EXPECT_FALSE(maybe.has_value());
        ASSERT_FALSE(ScanTarget(&maybe).assign(SqlValue("17")));
        EXPECT_EQ(maybe, 17);

        std::optional<int32_t> narrow;
        EXPECT_TRUE(ScanTarget(&narrow).assign(SqlValue(int64_t{1} << 40)));
        EXPECT_FALSE(narrow.has_value());

        SqlValue raw(3);
        ASSERT_FALSE(ScanTarget(&raw).assign(SqlValue()));
        EXPECT_TRUE(raw.isNull());
        ASSERT_FALSE(ScanTarget(&raw).assign(SqlValue(std::vector<unsigned char>{9})));
        EXPECT_EQ(raw, SqlValue(std::vector<unsigned char>{9}));
    }

    TEST(ScanTargetTest, NullDestinationPointerFails) {
        int32_t* missing = nullptr;
        Error err = ScanTarget(missing).assign(SqlValue(1));
        EXPECT_EQ(err.code, ErrorCode::ScanError);
    }

    TEST(ScanTargetTest, ReportsTargetTypeAndNullability) {
        std::optional<double> maybe;
        double plain = 0;
        SqlValue raw;
        EXPECT_TRUE(ScanTarget(&maybe).isNullable());
        EXPECT_FALSE(ScanTarget(&plain).isNullable());
        EXPECT_TRUE(ScanTarget(&raw).isNullable());
        EXPECT_STREQ(ScanTarget(&plain).targetTypeName(), "double");
        EXPECT_STREQ(ScanTarget(&maybe).targetTypeName(), "double");
    }

}  // namespace rowbind
