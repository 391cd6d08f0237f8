// rowbind/sql_value_core.cpp
#include <charconv>
#include <iomanip>  // For std::setfill, std::setw
#include <sstream>

#include "rowbind/sql_value.h"

namespace rowbind {

    SqlValue::SqlValue(std::nullptr_t) : m_storage(std::monostate{}) {
    }
    SqlValue::SqlValue(bool val) : m_storage(val) {
    }
    SqlValue::SqlValue(int8_t val) : m_storage(val) {
    }
    SqlValue::SqlValue(uint8_t val) : m_storage(val) {
    }
    SqlValue::SqlValue(int16_t val) : m_storage(val) {
    }
    SqlValue::SqlValue(uint16_t val) : m_storage(val) {
    }
    SqlValue::SqlValue(int32_t val) : m_storage(val) {
    }
    SqlValue::SqlValue(uint32_t val) : m_storage(val) {
    }
    SqlValue::SqlValue(int64_t val) : m_storage(val) {
    }
    SqlValue::SqlValue(uint64_t val) : m_storage(val) {
    }
    SqlValue::SqlValue(float val) : m_storage(val) {
    }
    SqlValue::SqlValue(double val) : m_storage(val) {
    }
    SqlValue::SqlValue(const char* val) {
        if (val) {
            m_storage = std::string(val);
        }
    }
    SqlValue::SqlValue(std::string val) : m_storage(std::move(val)) {
    }
    SqlValue::SqlValue(std::string_view val) : m_storage(std::string(val)) {
    }
    SqlValue::SqlValue(std::vector<unsigned char> val) : m_storage(std::move(val)) {
    }
    SqlValue::SqlValue(const ChronoDate& val) : m_storage(val) {
    }
    SqlValue::SqlValue(const ChronoTime& val) : m_storage(val) {
    }
    SqlValue::SqlValue(const ChronoDateTime& val) : m_storage(val) {
    }

    const char* sqlValueTypeName(SqlValueType type) {
        switch (type) {
            case SqlValueType::Null:
                return "NULL";
            case SqlValueType::Bool:
                return "bool";
            case SqlValueType::Int8:
                return "int8";
            case SqlValueType::UInt8:
                return "uint8";
            case SqlValueType::Int16:
                return "int16";
            case SqlValueType::UInt16:
                return "uint16";
            case SqlValueType::Int32:
                return "int32";
            case SqlValueType::UInt32:
                return "uint32";
            case SqlValueType::Int64:
                return "int64";
            case SqlValueType::UInt64:
                return "uint64";
            case SqlValueType::Float:
                return "float";
            case SqlValueType::Double:
                return "double";
            case SqlValueType::String:
                return "string";
            case SqlValueType::ByteArray:
                return "bytes";
            case SqlValueType::Date:
                return "date";
            case SqlValueType::Time:
                return "time";
            case SqlValueType::DateTime:
                return "datetime";
        }
        return "unknown";
    }

    const char* SqlValue::typeName() const {
        return sqlValueTypeName(type());
    }

    bool SqlValue::isIntegral() const {
        switch (type()) {
            case SqlValueType::Int8:
            case SqlValueType::UInt8:
            case SqlValueType::Int16:
            case SqlValueType::UInt16:
            case SqlValueType::Int32:
            case SqlValueType::UInt32:
            case SqlValueType::Int64:
            case SqlValueType::UInt64:
                return true;
            default:
                return false;
        }
    }

    bool SqlValue::isFloatingPoint() const {
        return type() == SqlValueType::Float || type() == SqlValueType::Double;
    }

    std::string SqlValue::toString() const {
        return std::visit(
            [](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "NULL";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "true" : "false";
                } else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, int16_t> || std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
                    return std::to_string(static_cast<long long>(v));
                } else if constexpr (std::is_same_v<T, uint8_t> || std::is_same_v<T, uint16_t> || std::is_same_v<T, uint32_t> || std::is_same_v<T, uint64_t>) {
                    return std::to_string(static_cast<unsigned long long>(v));
                } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                    // 最短可往返表示
                    char buf[64];
                    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
                    return ec == std::errc() ? std::string(buf, ptr) : std::string("nan");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return v;
                } else if constexpr (std::is_same_v<T, std::vector<unsigned char>>) {
                    return std::string(v.begin(), v.end());
                } else if constexpr (std::is_same_v<T, ChronoDate>) {
                    return text::formatDate(v);
                } else if constexpr (std::is_same_v<T, ChronoTime>) {
                    return text::formatTime(v);
                } else {
                    return text::formatDateTime(v);
                }
            },
            m_storage);
    }

    bool SqlValue::operator==(const SqlValue& other) const {
        return m_storage == other.m_storage;
    }

    namespace text {

        namespace {
            bool isDigit(char c) {
                return c >= '0' && c <= '9';
            }

            // str[pos, pos + width) 必须恰好是 width 位十进制数字
            bool parseFixedDigits(std::string_view str, std::size_t pos, std::size_t width, int& out) {
                if (pos + width > str.size()) {
                    return false;
                }
                for (std::size_t i = pos; i < pos + width; ++i) {
                    if (!isDigit(str[i])) return false;
                }
                auto [ptr, ec] = std::from_chars(str.data() + pos, str.data() + pos + width, out);
                return ec == std::errc() && ptr == str.data() + pos + width;
            }

            // 小数秒: '.' 后 1 到 6 位数字, 按微秒补齐. 没有小数部分时 consumed 为 0.
            bool parseFraction(std::string_view str, long long& micros_out, std::size_t& consumed) {
                consumed = 0;
                micros_out = 0;
                if (str.empty() || str.front() != '.') {
                    return true;
                }
                std::size_t digits = 0;
                while (1 + digits < str.size() && isDigit(str[1 + digits])) {
                    ++digits;
                }
                if (digits == 0 || digits > 6) return false;
                long long value = 0;
                auto [ptr, ec] = std::from_chars(str.data() + 1, str.data() + 1 + digits, value);
                if (ec != std::errc()) return false;
                for (std::size_t i = digits; i < 6; ++i) {
                    value *= 10;
                }
                micros_out = value;
                consumed = 1 + digits;
                return true;
            }

            void appendMicros(std::ostringstream& oss, long long micros) {
                if (micros != 0) {
                    oss << '.' << std::setw(6) << std::setfill('0') << micros;
                }
            }
        }  // namespace

        std::string formatDate(const SqlValue::ChronoDate& date) {
            std::ostringstream oss;
            oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-' << std::setw(2) << static_cast<unsigned>(date.month()) << '-' << std::setw(2) << static_cast<unsigned>(date.day());
            return oss.str();
        }

        std::string formatTime(const SqlValue::ChronoTime& time) {
            using namespace std::chrono;
            std::ostringstream oss;
            microseconds abs_time = time < microseconds::zero() ? -time : time;
            if (time < microseconds::zero()) {
                oss << '-';
            }
            const auto total_hours = duration_cast<hours>(abs_time);
            abs_time -= total_hours;
            const auto mins = duration_cast<minutes>(abs_time);
            abs_time -= mins;
            const auto secs = duration_cast<seconds>(abs_time);
            abs_time -= secs;
            oss << std::setfill('0') << std::setw(2) << total_hours.count() << ':' << std::setw(2) << mins.count() << ':' << std::setw(2) << secs.count();
            appendMicros(oss, abs_time.count());
            return oss.str();
        }

        std::string formatDateTime(const SqlValue::ChronoDateTime& date_time) {
            using namespace std::chrono;
            const auto tp_us = floor<microseconds>(date_time);
            const auto day_point = floor<days>(tp_us);
            const year_month_day ymd{day_point};
            const hh_mm_ss<microseconds> tod{tp_us - day_point};
            std::ostringstream oss;
            oss << formatDate(ymd) << ' ' << std::setfill('0') << std::setw(2) << tod.hours().count() << ':' << std::setw(2) << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count();
            appendMicros(oss, tod.subseconds().count());
            return oss.str();
        }

        bool parseDate(std::string_view str, SqlValue::ChronoDate& out) {
            // YYYY-MM-DD
            int year = 0, month = 0, day = 0;
            if (str.size() != 10 || str[4] != '-' || str[7] != '-') {
                return false;
            }
            if (!parseFixedDigits(str, 0, 4, year) || !parseFixedDigits(str, 5, 2, month) || !parseFixedDigits(str, 8, 2, day)) {
                return false;
            }
            const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)}, std::chrono::day{static_cast<unsigned>(day)}};
            if (!ymd.ok()) {
                return false;
            }
            out = ymd;
            return true;
        }

        bool parseTime(std::string_view str, SqlValue::ChronoTime& out) {
            // [-]H:MM:SS[.f], 小时 1 到 3 位 (MySQL TIME 上限 838)
            bool neg = false;
            if (!str.empty() && str.front() == '-') {
                neg = true;
                str.remove_prefix(1);
            }
            std::size_t hour_digits = 0;
            while (hour_digits < str.size() && isDigit(str[hour_digits])) {
                ++hour_digits;
            }
            if (hour_digits == 0 || hour_digits > 3) {
                return false;
            }
            int hour = 0, minute = 0, sec = 0;
            const std::size_t pos = hour_digits;
            if (!parseFixedDigits(str, 0, hour_digits, hour) || pos + 6 > str.size() || str[pos] != ':' || str[pos + 3] != ':') {
                return false;
            }
            if (!parseFixedDigits(str, pos + 1, 2, minute) || !parseFixedDigits(str, pos + 4, 2, sec)) {
                return false;
            }
            long long micros = 0;
            std::size_t frac_consumed = 0;
            std::string_view rest = str.substr(pos + 6);
            if (!parseFraction(rest, micros, frac_consumed) || frac_consumed != rest.size()) {
                return false;
            }
            if (hour > 838 || minute > 59 || sec > 59) {
                return false;
            }
            using namespace std::chrono;
            microseconds value = hours(hour) + minutes(minute) + seconds(sec) + microseconds(micros);
            out = neg ? -value : value;
            return true;
        }

        bool parseDateTime(std::string_view str, SqlValue::ChronoDateTime& out) {
            using namespace std::chrono;
            if (str.size() < 10) {
                return false;
            }
            SqlValue::ChronoDate date;
            if (!parseDate(str.substr(0, 10), date)) {
                return false;
            }
            sys_time<microseconds> result = sys_days{date};
            std::string_view rest = str.substr(10);
            if (!rest.empty() && (rest.front() == ' ' || rest.front() == 'T')) {
                rest.remove_prefix(1);
                if (!rest.empty() && rest.back() == 'Z') {
                    rest.remove_suffix(1);
                }
                SqlValue::ChronoTime tod;
                if (rest.empty() || rest.front() == '-' || !parseTime(rest, tod) || tod >= hours(24)) {
                    return false;
                }
                result += tod;
            } else if (!rest.empty()) {
                return false;
            }
            out = time_point_cast<system_clock::duration>(result);
            return true;
        }

    }  // namespace text

}  // namespace rowbind
