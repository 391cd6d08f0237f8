// rowbind_mysql/mysql_row_cursor.h
#pragma once

#include <mysql/mysql.h>

#include <cstddef>
#include <vector>

#include "rowbind/error.h"
#include "rowbind/row_cursor.h"
#include "rowbind_mysql/mysql_value_codec.h"

namespace rowbind_mysql {

    class MySqlPreparedStatement;

    // 已缓冲 (mysql_stmt_store_result) 的预处理语句结果集
    class MySqlRowCursor : public rowbind::IRowCursor {
      public:
        // columns 为空表示语句没有结果集, 游标不产生任何行
        MySqlRowCursor(MySqlPreparedStatement* statement, std::vector<MySqlColumnInfo> columns);
        ~MySqlRowCursor() override;

        MySqlRowCursor(const MySqlRowCursor&) = delete;
        MySqlRowCursor& operator=(const MySqlRowCursor&) = delete;

        bool next() override;
        rowbind::Error scan(const std::vector<rowbind::ScanTarget>& targets) override;
        rowbind::Error lastError() const override;
        rowbind::Error close() noexcept override;

        std::size_t columnCount() const {
            return m_buffers.columnCount();
        }
        const MySqlColumnInfo& column(std::size_t index) const {
            return m_buffers.column(index);
        }
        std::size_t rowsFetched() const {
            return m_rows_fetched;
        }

      private:
        friend class MySqlPreparedStatement;
        rowbind::Error bindResultBuffers();

        MySqlPreparedStatement* m_statement;
        MYSQL_STMT* m_stmt_handle;
        MySqlResultBuffers m_buffers;
        bool m_has_result_set;
        bool m_on_row = false;
        bool m_exhausted = false;
        bool m_closed = false;
        std::size_t m_rows_fetched = 0;
        rowbind::Error m_last_error;
    };

}  // namespace rowbind_mysql
