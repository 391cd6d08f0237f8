// rowbind_mysql/mysql_row_cursor.cpp
#include "rowbind_mysql/mysql_row_cursor.h"

#include <mysql/mysql.h>

#include <string>

#include "rowbind/config/rowbind_config.h"
#include "rowbind_mysql/mysql_error_reporting.h"
#include "rowbind_mysql/mysql_prepared_statement.h"

namespace rowbind_mysql {

    using rowbind::Error;
    using rowbind::ErrorCode;

    MySqlRowCursor::MySqlRowCursor(MySqlPreparedStatement* statement, std::vector<MySqlColumnInfo> columns)
        : m_statement(statement), m_stmt_handle(statement ? statement->getNativeStatementHandle() : nullptr), m_has_result_set(!columns.empty()) {
        m_buffers.setup(std::move(columns));
    }

    MySqlRowCursor::~MySqlRowCursor() {
        if (m_closed) return;
        Error err = close();
        auto logger = rowbind::config::getLogger();
        if (err && logger) {
            logger->warn("[MySqlRowCursor {}] Close in destructor failed: {}", (void*)this, err.toString());
        }
    }

    Error MySqlRowCursor::bindResultBuffers() {
        if (!m_has_result_set) return rowbind::make_ok();
        if (mysql_stmt_bind_result(m_stmt_handle, m_buffers.binds()) != 0) {
            return errorFromStatementHandle(m_stmt_handle, ErrorCode::ExecutionError, "mysql_stmt_bind_result failed");
        }
        return rowbind::make_ok();
    }

    bool MySqlRowCursor::next() {
        m_on_row = false;
        if (m_closed || m_exhausted || !m_has_result_set) {
            return false;
        }

        int fetch_rc = mysql_stmt_fetch(m_stmt_handle);
        if (fetch_rc == 0) {
            m_on_row = true;
        } else if (fetch_rc == MYSQL_DATA_TRUNCATED) {
            Error refetch_err = m_buffers.refetchTruncated(m_stmt_handle);
            if (refetch_err) {
                m_last_error = refetch_err.atRow(m_rows_fetched);
                m_exhausted = true;
                return false;
            }
            m_on_row = true;
        } else if (fetch_rc == MYSQL_NO_DATA) {
            m_exhausted = true;
            return false;
        } else {
            m_last_error = errorFromStatementHandle(m_stmt_handle, ErrorCode::TerminalCursorError, "mysql_stmt_fetch failed");
            m_last_error.atRow(m_rows_fetched);
            m_exhausted = true;
            return false;
        }

        ++m_rows_fetched;
        return true;
    }

    Error MySqlRowCursor::scan(const std::vector<rowbind::ScanTarget>& targets) {
        if (!m_on_row) {
            return Error(ErrorCode::ScanError, "scan called without a current row");
        }
        const std::size_t row_index = m_rows_fetched - 1;
        if (targets.size() != m_buffers.columnCount()) {
            return Error(ErrorCode::ScanError, "expected " + std::to_string(m_buffers.columnCount()) + " destination arguments in scan, got " + std::to_string(targets.size())).atRow(row_index);
        }

        for (std::size_t i = 0; i < targets.size(); ++i) {
            auto value = m_buffers.value(i);
            if (!value) {
                Error err = value.error();
                return err.atRow(row_index);
            }
            Error assign_err = targets[i].assign(*value);
            if (assign_err) {
                assign_err.message = "column " + std::to_string(i) + " ('" + m_buffers.column(i).name + "'): " + assign_err.message;
                return assign_err.atRow(row_index).atColumn(i);
            }
        }
        return rowbind::make_ok();
    }

    Error MySqlRowCursor::lastError() const {
        return m_last_error;
    }

    Error MySqlRowCursor::close() noexcept {
        if (m_closed) {
            return rowbind::make_ok();
        }
        m_closed = true;
        m_on_row = false;

        Error result;
        if (m_has_result_set && m_stmt_handle && mysql_stmt_free_result(m_stmt_handle) != 0) {
            result = errorFromStatementHandle(m_stmt_handle, ErrorCode::CursorReleaseError, "mysql_stmt_free_result failed");
        }
        if (m_statement) {
            m_statement->onCursorClosed();
        }
        auto logger = rowbind::config::getLogger();
        if (logger) logger->trace("[MySqlRowCursor {}] Closed after {} row(s).", (void*)this, m_rows_fetched);
        return result;
    }

}  // namespace rowbind_mysql
