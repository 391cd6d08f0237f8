// rowbind_mysql/mysql_prepared_statement.h
#pragma once

#include <mysql/mysql.h>

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "rowbind/error.h"
#include "rowbind/statement_executor.h"
#include "rowbind_mysql/mysql_value_codec.h"

namespace rowbind_mysql {

    class MySqlRowCursor;

    // 服务端预处理语句. 同一时刻最多只有一个打开的游标, 游标不得比语句活得更久.
    class MySqlPreparedStatement : public rowbind::IStatementExecutor {
      public:
        // 接管已 prepare 成功的 stmt_handle
        MySqlPreparedStatement(MYSQL_STMT* stmt_handle, std::string sql);
        ~MySqlPreparedStatement() override;

        MySqlPreparedStatement(const MySqlPreparedStatement&) = delete;
        MySqlPreparedStatement& operator=(const MySqlPreparedStatement&) = delete;
        MySqlPreparedStatement(MySqlPreparedStatement&&) = delete;
        MySqlPreparedStatement& operator=(MySqlPreparedStatement&&) = delete;

        std::expected<std::unique_ptr<rowbind::IRowCursor>, rowbind::Error> executeQuery(const std::vector<rowbind::SqlValue>& args) override;

        unsigned long paramCount() const {
            return m_param_count;
        }
        const std::string& sql() const {
            return m_sql;
        }
        bool hasOpenCursor() const {
            return m_cursor_open;
        }
        my_ulonglong affectedRows() const {
            return m_affected_rows;
        }

        MYSQL_STMT* getNativeStatementHandle() const {
            return m_stmt_handle;
        }

      private:
        friend class MySqlRowCursor;
        void onCursorClosed() {
            m_cursor_open = false;
        }

        rowbind::Error bindArguments(const std::vector<rowbind::SqlValue>& args);

        MYSQL_STMT* m_stmt_handle;
        std::string m_sql;
        unsigned long m_param_count;
        MySqlParamBuffers m_params;
        bool m_cursor_open = false;
        my_ulonglong m_affected_rows = 0;
    };

}  // namespace rowbind_mysql
