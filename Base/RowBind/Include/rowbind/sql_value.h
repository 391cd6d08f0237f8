// rowbind/sql_value.h
#pragma once
#include <QVariant>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace rowbind {

    enum class SqlValueType { Null, Bool, Int8, UInt8, Int16, UInt16, Int32, UInt32, Int64, UInt64, Float, Double, String, ByteArray, Date, Time, DateTime };

    // 绑定参数与解码后的列值共用的值类型
    class SqlValue {
      public:
        using ChronoDate = std::chrono::year_month_day;
        using ChronoTime = std::chrono::microseconds;  // 有符号, 可超过 24 小时 (MySQL TIME)
        using ChronoDateTime = std::chrono::system_clock::time_point;  // 按 UTC 解释

        // 下标与 SqlValueType 一一对应
        using StorageType = std::variant<std::monostate,              // 0: Null
                                         bool,                        // 1
                                         int8_t,                      // 2
                                         uint8_t,                     // 3
                                         int16_t,                     // 4
                                         uint16_t,                    // 5
                                         int32_t,                     // 6
                                         uint32_t,                    // 7
                                         int64_t,                     // 8
                                         uint64_t,                    // 9
                                         float,                       // 10
                                         double,                      // 11
                                         std::string,                 // 12
                                         std::vector<unsigned char>,  // 13
                                         ChronoDate,                  // 14
                                         ChronoTime,                  // 15
                                         ChronoDateTime               // 16
                                         >;

        SqlValue() = default;
        SqlValue(std::nullptr_t);
        SqlValue(bool val);
        SqlValue(int8_t val);
        SqlValue(uint8_t val);
        SqlValue(int16_t val);
        SqlValue(uint16_t val);
        SqlValue(int32_t val);
        SqlValue(uint32_t val);
        SqlValue(int64_t val);
        SqlValue(uint64_t val);
        // long long 与 int64_t 不是同一类型的平台上 (LP64), 字面量 1LL 等按 64 位整数保存
        template <typename T>
            requires(std::is_same_v<T, long long> && !std::is_same_v<long long, int64_t>)
        SqlValue(T val) : m_storage(static_cast<int64_t>(val)) {
        }
        template <typename T>
            requires(std::is_same_v<T, unsigned long long> && !std::is_same_v<unsigned long long, uint64_t>)
        SqlValue(T val) : m_storage(static_cast<uint64_t>(val)) {
        }
        SqlValue(float val);
        SqlValue(double val);
        SqlValue(const char* val);
        SqlValue(std::string val);
        SqlValue(std::string_view val);
        SqlValue(std::vector<unsigned char> val);
        SqlValue(const ChronoDate& val);
        SqlValue(const ChronoTime& val);
        SqlValue(const ChronoDateTime& val);

        bool isNull() const {
            return m_storage.index() == 0;
        }
        SqlValueType type() const {
            return static_cast<SqlValueType>(m_storage.index());
        }
        const char* typeName() const;

        bool isIntegral() const;
        bool isFloatingPoint() const;

        const StorageType& storage() const {
            return m_storage;
        }

        template <typename T>
        const T* get_if() const noexcept {
            return std::get_if<T>(&m_storage);
        }

        // 文本表示, NULL 为 "NULL"; 日期时间使用 MySQL 文本格式
        std::string toString() const;

        QVariant toQVariant() const;
        static SqlValue fromQVariant(const QVariant& qv);

        bool operator==(const SqlValue& other) const;
        bool operator!=(const SqlValue& other) const {
            return !(*this == other);
        }

      private:
        StorageType m_storage;
    };

    const char* sqlValueTypeName(SqlValueType type);

    // 日期时间文本格式化/解析, 供 SqlValue::toString 与 ScanTarget 共用
    namespace text {
        std::string formatDate(const SqlValue::ChronoDate& date);
        std::string formatTime(const SqlValue::ChronoTime& time);
        std::string formatDateTime(const SqlValue::ChronoDateTime& date_time);

        bool parseDate(std::string_view str, SqlValue::ChronoDate& out);
        bool parseTime(std::string_view str, SqlValue::ChronoTime& out);
        bool parseDateTime(std::string_view str, SqlValue::ChronoDateTime& out);
    }  // namespace text

}  // namespace rowbind
