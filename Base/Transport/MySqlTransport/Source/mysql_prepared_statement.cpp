// rowbind_mysql/mysql_prepared_statement.cpp
#include "rowbind_mysql/mysql_prepared_statement.h"

#include <mysql/mysql.h>

#include "rowbind/config/rowbind_config.h"
#include "rowbind_mysql/mysql_error_reporting.h"
#include "rowbind_mysql/mysql_row_cursor.h"

namespace rowbind_mysql {

    using rowbind::Error;
    using rowbind::ErrorCode;
    using rowbind::SqlValue;

    MySqlPreparedStatement::MySqlPreparedStatement(MYSQL_STMT* stmt_handle, std::string sql) : m_stmt_handle(stmt_handle), m_sql(std::move(sql)), m_param_count(stmt_handle ? mysql_stmt_param_count(stmt_handle) : 0) {
    }

    MySqlPreparedStatement::~MySqlPreparedStatement() {
        if (m_stmt_handle) {
            if (mysql_stmt_close(m_stmt_handle) != 0) {
                auto logger = rowbind::config::getLogger();
                if (logger) logger->warn("[MySqlPreparedStatement {}] mysql_stmt_close failed.", (void*)this);
            }
            m_stmt_handle = nullptr;
        }
    }

    Error MySqlPreparedStatement::bindArguments(const std::vector<SqlValue>& args) {
        if (args.size() != m_param_count) {
            return Error(ErrorCode::ExecutionError, "expected " + std::to_string(m_param_count) + " arguments, got " + std::to_string(args.size()));
        }
        m_params.reset(args.size());
        for (std::size_t i = 0; i < args.size(); ++i) {
            Error err = m_params.bind(i, args[i]);
            if (err) {
                err.message = "argument " + std::to_string(i) + ": " + err.message;
                err.code = ErrorCode::ExecutionError;
                return err;
            }
        }
        if (m_param_count > 0 && mysql_stmt_bind_param(m_stmt_handle, m_params.binds()) != 0) {
            return errorFromStatementHandle(m_stmt_handle, ErrorCode::ExecutionError, "mysql_stmt_bind_param failed");
        }
        return rowbind::make_ok();
    }

    std::expected<std::unique_ptr<rowbind::IRowCursor>, Error> MySqlPreparedStatement::executeQuery(const std::vector<SqlValue>& args) {
        if (!m_stmt_handle) {
            return std::unexpected(Error(ErrorCode::ExecutionError, "Statement handle not initialized for executeQuery."));
        }
        if (m_cursor_open) {
            return std::unexpected(Error(ErrorCode::ExecutionError, "Statement already has an open cursor; close it before executing again."));
        }

        if (Error bind_err = bindArguments(args)) {
            return std::unexpected(bind_err);
        }

        if (mysql_stmt_execute(m_stmt_handle) != 0) {
            return std::unexpected(errorFromStatementHandle(m_stmt_handle, ErrorCode::ExecutionError, "mysql_stmt_execute failed"));
        }
        m_affected_rows = mysql_stmt_affected_rows(m_stmt_handle);

        auto logger = rowbind::config::getLogger();

        MYSQL_RES* metadata = mysql_stmt_result_metadata(m_stmt_handle);
        if (!metadata) {
            if (mysql_stmt_errno(m_stmt_handle) != 0) {
                return std::unexpected(errorFromStatementHandle(m_stmt_handle, ErrorCode::ExecutionError, "mysql_stmt_result_metadata failed"));
            }
            // 没有结果集的语句 (INSERT / UPDATE ...)
            if (logger) logger->debug("[MySqlPreparedStatement {}] Executed without result set, {} row(s) affected.", (void*)this, m_affected_rows);
            m_cursor_open = true;
            return std::make_unique<MySqlRowCursor>(this, std::vector<MySqlColumnInfo>());
        }

        if (mysql_stmt_store_result(m_stmt_handle) != 0) {
            Error err = errorFromStatementHandle(m_stmt_handle, ErrorCode::ExecutionError, "mysql_stmt_store_result failed");
            mysql_free_result(metadata);
            return std::unexpected(err);
        }

        // store_result 之后 max_length 才有效
        unsigned int field_count = mysql_num_fields(metadata);
        MYSQL_FIELD* fields = mysql_fetch_fields(metadata);
        std::vector<MySqlColumnInfo> columns;
        columns.reserve(field_count);
        for (unsigned int i = 0; i < field_count; ++i) {
            columns.push_back(MySqlColumnInfo::fromField(fields[i]));
        }
        mysql_free_result(metadata);

        auto cursor = std::make_unique<MySqlRowCursor>(this, std::move(columns));
        if (Error bind_err = cursor->bindResultBuffers()) {
            mysql_stmt_free_result(m_stmt_handle);
            return std::unexpected(bind_err);
        }
        m_cursor_open = true;
        if (logger) logger->debug("[MySqlPreparedStatement {}] Executed, {} column(s), {} buffered row(s).", (void*)this, field_count, mysql_stmt_num_rows(m_stmt_handle));
        return cursor;
    }

}  // namespace rowbind_mysql
