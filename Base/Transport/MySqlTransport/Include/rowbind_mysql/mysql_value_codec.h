// rowbind_mysql/mysql_value_codec.h
#pragma once
#include <mysql/mysql.h>

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "rowbind/error.h"
#include "rowbind/sql_value.h"

namespace rowbind_mysql {

    // 结果集中一列的元数据, 只保留解码需要的部分
    struct MySqlColumnInfo {
        static constexpr unsigned int BINARY_CHARSET_NR = 63;

        std::string name;
        enum enum_field_types type = MYSQL_TYPE_NULL;
        bool is_unsigned = false;
        bool is_binary = false;  // 二进制字符集: BLOB/BINARY 按字节返回
        unsigned long length = 0;
        unsigned long max_length = 0;

        static MySqlColumnInfo fromField(const MYSQL_FIELD& field);
    };

    // --- MYSQL_TIME <-> chrono (按 UTC 解释) ---
    MYSQL_TIME dateToMySqlTime(const rowbind::SqlValue::ChronoDate& date);
    MYSQL_TIME timeToMySqlTime(const rowbind::SqlValue::ChronoTime& time);
    MYSQL_TIME dateTimeToMySqlTime(const rowbind::SqlValue::ChronoDateTime& date_time);

    // field_type 为 MYSQL_TYPE_DATE / TIME / DATETIME / TIMESTAMP
    std::expected<rowbind::SqlValue, rowbind::Error> sqlValueFromMySqlTime(const MYSQL_TIME& mysql_time, enum enum_field_types field_type);

    // --- 输出缓冲的布局 ---
    // 请求 libmysqlclient 以何种 buffer_type 返回该列: YEAR 作为 SHORT, DECIMAL 作为字符串, BIT/BLOB 作为字节.
    enum enum_field_types outputBufferType(const MySqlColumnInfo& column);
    unsigned long outputBufferSize(const MySqlColumnInfo& column);

    // 按 outputBufferType(column) 的布局解码一个非 NULL 的列值
    std::expected<rowbind::SqlValue, rowbind::Error> decodeColumnValue(const MySqlColumnInfo& column, const void* buffer, unsigned long length);

    // 把一个参数值写入 bind, 数据存放在 storage 中. bind 在 storage 生命周期内有效.
    rowbind::Error encodeParamValue(const rowbind::SqlValue& value, MYSQL_BIND& bind, std::vector<unsigned char>& storage, unsigned long* length);

    // 预处理语句的输入参数缓冲
    class MySqlParamBuffers {
      public:
        void reset(std::size_t count);
        rowbind::Error bind(std::size_t index, const rowbind::SqlValue& value);

        MYSQL_BIND* binds() {
            return m_binds.data();
        }
        const MYSQL_BIND& at(std::size_t index) const {
            return m_binds.at(index);
        }
        std::size_t size() const {
            return m_binds.size();
        }

      private:
        std::vector<MYSQL_BIND> m_binds;
        std::vector<std::vector<unsigned char>> m_data;
        std::vector<unsigned long> m_lengths;
    };

    // 预处理语句的输出列缓冲, 每次 fetch 复用
    class MySqlResultBuffers {
      public:
        void setup(std::vector<MySqlColumnInfo> columns);

        MYSQL_BIND* binds() {
            return m_binds.data();
        }
        std::size_t columnCount() const {
            return m_columns.size();
        }
        const MySqlColumnInfo& column(std::size_t index) const {
            return m_columns.at(index);
        }

        bool isNull(std::size_t index) const {
            return m_is_null[index];
        }
        bool isTruncated(std::size_t index) const;

        // 把被截断的列扩容后用 mysql_stmt_fetch_column 重新读取, 并重新绑定结果缓冲.
        rowbind::Error refetchTruncated(MYSQL_STMT* stmt);

        std::expected<rowbind::SqlValue, rowbind::Error> value(std::size_t index) const;

      private:
        std::vector<MySqlColumnInfo> m_columns;
        std::vector<MYSQL_BIND> m_binds;
        std::vector<std::vector<unsigned char>> m_data;
        std::vector<unsigned long> m_lengths;
        std::unique_ptr<bool[]> m_is_null;
        std::unique_ptr<bool[]> m_error;
    };

}  // namespace rowbind_mysql
