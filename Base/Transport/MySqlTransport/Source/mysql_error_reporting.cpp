// rowbind_mysql/mysql_error_reporting.cpp
#include "rowbind_mysql/mysql_error_reporting.h"

namespace rowbind_mysql {

    namespace {
        rowbind::Error composeError(rowbind::ErrorCode code, const std::string& context, unsigned int err_no, const char* sql_state, const char* err_msg) {
            std::string full_msg = context;
            if (err_msg && err_msg[0] != '\0') {
                if (!full_msg.empty()) full_msg += ": ";
                full_msg += err_msg;
            }
            return rowbind::Error(code, full_msg, static_cast<int>(err_no), (err_no != 0 && sql_state) ? std::string(sql_state) : std::string());
        }
    }  // namespace

    rowbind::Error errorFromMySqlHandle(MYSQL* handle, rowbind::ErrorCode code, const std::string& context) {
        if (!handle) {
            return rowbind::Error(code, context.empty() ? "MYSQL handle is null" : context + ": MYSQL handle is null");
        }
        unsigned int err_no = mysql_errno(handle);
        if (err_no == 0) {
            return rowbind::Error(code, context);
        }
        return composeError(code, context, err_no, mysql_sqlstate(handle), mysql_error(handle));
    }

    rowbind::Error errorFromStatementHandle(MYSQL_STMT* stmt_handle, rowbind::ErrorCode code, const std::string& context) {
        if (!stmt_handle) {
            return rowbind::Error(code, context.empty() ? "MYSQL_STMT handle is null" : context + ": MYSQL_STMT handle is null");
        }
        unsigned int err_no = mysql_stmt_errno(stmt_handle);
        if (err_no == 0) {
            return rowbind::Error(code, context);
        }
        return composeError(code, context, err_no, mysql_stmt_sqlstate(stmt_handle), mysql_stmt_error(stmt_handle));
    }

}  // namespace rowbind_mysql
