// rowbind_mysql/mysql_column_decoding.cpp
#include <algorithm>  // For std::max
#include <cstring>    // For std::memcpy, std::memset
#include <string>

#include "rowbind_mysql/mysql_error_reporting.h"
#include "rowbind_mysql/mysql_value_codec.h"

namespace rowbind_mysql {

    using rowbind::Error;
    using rowbind::ErrorCode;
    using rowbind::SqlValue;

    namespace {
        constexpr unsigned long kDefaultVarBufferSize = 256;
        constexpr unsigned long kDecimalBufferSize = 66;  // 65 位数字 + 符号

        template <typename T>
        T loadFixed(const void* buffer) {
            T value;
            std::memcpy(&value, buffer, sizeof(T));
            return value;
        }
    }  // namespace

    MySqlColumnInfo MySqlColumnInfo::fromField(const MYSQL_FIELD& field) {
        MySqlColumnInfo info;
        info.name = field.name ? std::string(field.name, field.name_length) : std::string();
        info.type = field.type;
        info.is_unsigned = (field.flags & UNSIGNED_FLAG) != 0;
        info.is_binary = field.charsetnr == BINARY_CHARSET_NR;
        info.length = field.length;
        info.max_length = field.max_length;
        return info;
    }

    enum enum_field_types outputBufferType(const MySqlColumnInfo& column) {
        switch (column.type) {
            case MYSQL_TYPE_TINY:
            case MYSQL_TYPE_SHORT:
            case MYSQL_TYPE_LONG:
            case MYSQL_TYPE_LONGLONG:
            case MYSQL_TYPE_FLOAT:
            case MYSQL_TYPE_DOUBLE:
            case MYSQL_TYPE_DATE:
            case MYSQL_TYPE_TIME:
            case MYSQL_TYPE_DATETIME:
            case MYSQL_TYPE_TIMESTAMP:
                return column.type;
            case MYSQL_TYPE_INT24:
                return MYSQL_TYPE_LONG;
            case MYSQL_TYPE_YEAR:
                return MYSQL_TYPE_SHORT;
            case MYSQL_TYPE_BIT:
            case MYSQL_TYPE_GEOMETRY:
                return MYSQL_TYPE_BLOB;
            case MYSQL_TYPE_TINY_BLOB:
            case MYSQL_TYPE_MEDIUM_BLOB:
            case MYSQL_TYPE_LONG_BLOB:
            case MYSQL_TYPE_BLOB:
            case MYSQL_TYPE_STRING:
            case MYSQL_TYPE_VAR_STRING:
            case MYSQL_TYPE_VARCHAR:
                return column.is_binary ? MYSQL_TYPE_BLOB : MYSQL_TYPE_STRING;
            default:
                // DECIMAL, NEWDECIMAL, ENUM, SET, JSON, NULL
                return MYSQL_TYPE_STRING;
        }
    }

    unsigned long outputBufferSize(const MySqlColumnInfo& column) {
        switch (outputBufferType(column)) {
            case MYSQL_TYPE_TINY:
                return sizeof(int8_t);
            case MYSQL_TYPE_SHORT:
                return sizeof(int16_t);
            case MYSQL_TYPE_LONG:
                return sizeof(int32_t);
            case MYSQL_TYPE_LONGLONG:
                return sizeof(int64_t);
            case MYSQL_TYPE_FLOAT:
                return sizeof(float);
            case MYSQL_TYPE_DOUBLE:
                return sizeof(double);
            case MYSQL_TYPE_DATE:
            case MYSQL_TYPE_TIME:
            case MYSQL_TYPE_DATETIME:
            case MYSQL_TYPE_TIMESTAMP:
                return sizeof(MYSQL_TIME);
            default:
                break;
        }
        if (column.type == MYSQL_TYPE_DECIMAL || column.type == MYSQL_TYPE_NEWDECIMAL) {
            return std::max(column.max_length, kDecimalBufferSize);
        }
        // max_length 由 STMT_ATTR_UPDATE_MAX_LENGTH 在 store_result 后给出, 过小时走截断重读
        if (column.max_length > 0) return column.max_length;
        return kDefaultVarBufferSize;
    }

    std::expected<SqlValue, Error> decodeColumnValue(const MySqlColumnInfo& column, const void* buffer, unsigned long length) {
        enum enum_field_types buffer_type = outputBufferType(column);
        switch (buffer_type) {
            case MYSQL_TYPE_TINY:
                if (column.is_unsigned) return SqlValue(loadFixed<uint8_t>(buffer));
                return SqlValue(loadFixed<int8_t>(buffer));
            case MYSQL_TYPE_SHORT:
                if (column.is_unsigned) return SqlValue(loadFixed<uint16_t>(buffer));
                return SqlValue(loadFixed<int16_t>(buffer));
            case MYSQL_TYPE_LONG:
                if (column.is_unsigned) return SqlValue(loadFixed<uint32_t>(buffer));
                return SqlValue(loadFixed<int32_t>(buffer));
            case MYSQL_TYPE_LONGLONG:
                if (column.is_unsigned) return SqlValue(loadFixed<uint64_t>(buffer));
                return SqlValue(loadFixed<int64_t>(buffer));
            case MYSQL_TYPE_FLOAT:
                return SqlValue(loadFixed<float>(buffer));
            case MYSQL_TYPE_DOUBLE:
                return SqlValue(loadFixed<double>(buffer));
            case MYSQL_TYPE_DATE:
            case MYSQL_TYPE_TIME:
            case MYSQL_TYPE_DATETIME:
            case MYSQL_TYPE_TIMESTAMP:
                return sqlValueFromMySqlTime(loadFixed<MYSQL_TIME>(buffer), buffer_type);
            case MYSQL_TYPE_BLOB: {
                const auto* bytes = static_cast<const unsigned char*>(buffer);
                return SqlValue(std::vector<unsigned char>(bytes, bytes + length));
            }
            case MYSQL_TYPE_STRING:
                return SqlValue(std::string(static_cast<const char*>(buffer), length));
            default:
                return std::unexpected(Error(ErrorCode::InternalError, "No decoder for MySQL buffer type " + std::to_string(buffer_type) + " (column '" + column.name + "')"));
        }
    }

    void MySqlResultBuffers::setup(std::vector<MySqlColumnInfo> columns) {
        m_columns = std::move(columns);
        const std::size_t count = m_columns.size();

        m_binds.assign(count, MYSQL_BIND{});
        m_data.assign(count, std::vector<unsigned char>());
        m_lengths.assign(count, 0UL);
        m_is_null = std::make_unique<bool[]>(count);
        m_error = std::make_unique<bool[]>(count);

        for (std::size_t i = 0; i < count; ++i) {
            const MySqlColumnInfo& column = m_columns[i];
            MYSQL_BIND& bind = m_binds[i];
            std::memset(&bind, 0, sizeof(MYSQL_BIND));

            unsigned long buffer_sz = outputBufferSize(column);
            if (buffer_sz == 0) buffer_sz = 1;
            m_data[i].assign(buffer_sz, static_cast<unsigned char>(0));

            bind.buffer_type = outputBufferType(column);
            bind.buffer = m_data[i].data();
            bind.buffer_length = buffer_sz;
            bind.length = &m_lengths[i];
            bind.is_null = &m_is_null[i];
            bind.error = &m_error[i];
            bind.is_unsigned = column.is_unsigned;
        }
    }

    bool MySqlResultBuffers::isTruncated(std::size_t index) const {
        return m_error[index] || m_lengths[index] > m_binds[index].buffer_length;
    }

    Error MySqlResultBuffers::refetchTruncated(MYSQL_STMT* stmt) {
        bool rebind_needed = false;
        for (std::size_t i = 0; i < m_columns.size(); ++i) {
            if (m_is_null[i] || !isTruncated(i)) continue;

            unsigned long full_length = m_lengths[i];
            m_data[i].assign(full_length == 0 ? 1 : full_length, static_cast<unsigned char>(0));
            m_binds[i].buffer = m_data[i].data();
            m_binds[i].buffer_length = static_cast<unsigned long>(m_data[i].size());
            m_error[i] = false;
            rebind_needed = true;

            if (mysql_stmt_fetch_column(stmt, &m_binds[i], static_cast<unsigned int>(i), 0) != 0) {
                return errorFromStatementHandle(stmt, ErrorCode::TerminalCursorError, "mysql_stmt_fetch_column failed for truncated column '" + m_columns[i].name + "'").atColumn(i);
            }
        }
        // 缓冲区地址已改变, 下一次 fetch 之前必须重新绑定
        if (rebind_needed && mysql_stmt_bind_result(stmt, m_binds.data()) != 0) {
            return errorFromStatementHandle(stmt, ErrorCode::TerminalCursorError, "mysql_stmt_bind_result failed after refetch");
        }
        return rowbind::make_ok();
    }

    std::expected<SqlValue, Error> MySqlResultBuffers::value(std::size_t index) const {
        if (m_is_null[index]) {
            return SqlValue();
        }
        unsigned long length = std::min(m_lengths[index], static_cast<unsigned long>(m_data[index].size()));
        auto decoded = decodeColumnValue(m_columns[index], m_data[index].data(), length);
        if (!decoded) {
            Error err = decoded.error();
            err.message = "column '" + m_columns[index].name + "': " + err.message;
            err.atColumn(index);
            return std::unexpected(err);
        }
        return decoded;
    }

}  // namespace rowbind_mysql
