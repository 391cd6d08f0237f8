// rowbind_mysql/mysql_time_conversion.cpp
#include <chrono>
#include <cstring>  // For std::memset
#include <string>

#include "rowbind_mysql/mysql_value_codec.h"

namespace rowbind_mysql {

    using rowbind::Error;
    using rowbind::ErrorCode;
    using rowbind::SqlValue;

    MYSQL_TIME dateToMySqlTime(const SqlValue::ChronoDate& date) {
        MYSQL_TIME mt;
        std::memset(&mt, 0, sizeof(MYSQL_TIME));
        mt.year = static_cast<unsigned int>(static_cast<int>(date.year()));
        mt.month = static_cast<unsigned int>(date.month());
        mt.day = static_cast<unsigned int>(date.day());
        mt.time_type = MYSQL_TIMESTAMP_DATE;
        return mt;
    }

    MYSQL_TIME timeToMySqlTime(const SqlValue::ChronoTime& time) {
        MYSQL_TIME mt;
        std::memset(&mt, 0, sizeof(MYSQL_TIME));
        auto total = time;
        if (total < SqlValue::ChronoTime::zero()) {
            mt.neg = true;
            total = -total;
        }
        auto hours = std::chrono::duration_cast<std::chrono::hours>(total);
        total -= hours;
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(total);
        total -= minutes;
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(total);
        total -= seconds;
        mt.hour = static_cast<unsigned int>(hours.count());
        mt.minute = static_cast<unsigned int>(minutes.count());
        mt.second = static_cast<unsigned int>(seconds.count());
        mt.second_part = static_cast<unsigned long>(total.count());
        mt.time_type = MYSQL_TIMESTAMP_TIME;
        return mt;
    }

    MYSQL_TIME dateTimeToMySqlTime(const SqlValue::ChronoDateTime& date_time) {
        auto micros = std::chrono::floor<std::chrono::microseconds>(date_time);
        auto day_point = std::chrono::floor<std::chrono::days>(micros);
        std::chrono::year_month_day ymd(day_point);
        std::chrono::hh_mm_ss<std::chrono::microseconds> tod(micros - day_point);

        MYSQL_TIME mt = dateToMySqlTime(ymd);
        mt.hour = static_cast<unsigned int>(tod.hours().count());
        mt.minute = static_cast<unsigned int>(tod.minutes().count());
        mt.second = static_cast<unsigned int>(tod.seconds().count());
        mt.second_part = static_cast<unsigned long>(tod.subseconds().count());
        mt.time_type = MYSQL_TIMESTAMP_DATETIME;
        return mt;
    }

    std::expected<SqlValue, Error> sqlValueFromMySqlTime(const MYSQL_TIME& mysql_time, enum enum_field_types field_type) {
        if (field_type == MYSQL_TYPE_TIME) {
            std::chrono::microseconds total = std::chrono::hours(static_cast<long long>(mysql_time.day) * 24 + mysql_time.hour) + std::chrono::minutes(mysql_time.minute) + std::chrono::seconds(mysql_time.second) + std::chrono::microseconds(mysql_time.second_part);
            return SqlValue(mysql_time.neg ? -total : total);
        }

        if (field_type != MYSQL_TYPE_DATE && field_type != MYSQL_TYPE_DATETIME && field_type != MYSQL_TYPE_TIMESTAMP) {
            return std::unexpected(Error(ErrorCode::InternalError, "MYSQL_TIME conversion requested for non-temporal field type " + std::to_string(field_type)));
        }
        if (mysql_time.year == 0 && mysql_time.month == 0 && mysql_time.day == 0) {
            return std::unexpected(Error(ErrorCode::ScanError, "zero date (0000-00-00) cannot be represented"));
        }

        std::chrono::year_month_day ymd{std::chrono::year(static_cast<int>(mysql_time.year)), std::chrono::month(mysql_time.month), std::chrono::day(mysql_time.day)};
        if (!ymd.ok()) {
            return std::unexpected(Error(ErrorCode::ScanError, "invalid date " + std::to_string(mysql_time.year) + "-" + std::to_string(mysql_time.month) + "-" + std::to_string(mysql_time.day)));
        }
        if (field_type == MYSQL_TYPE_DATE) {
            return SqlValue(ymd);
        }

        if (mysql_time.hour > 23 || mysql_time.minute > 59 || mysql_time.second > 59 || mysql_time.second_part > 999999) {
            return std::unexpected(Error(ErrorCode::ScanError, "invalid time of day in DATETIME value"));
        }
        SqlValue::ChronoDateTime tp = std::chrono::sys_days(ymd) + std::chrono::hours(mysql_time.hour) + std::chrono::minutes(mysql_time.minute) + std::chrono::seconds(mysql_time.second) + std::chrono::microseconds(mysql_time.second_part);
        return SqlValue(tp);
    }

}  // namespace rowbind_mysql
