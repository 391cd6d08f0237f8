// rowbind_mysql/mysql_error_reporting.h
#pragma once
#include <mysql/mysql.h>

#include <string>

#include "rowbind/error.h"

namespace rowbind_mysql {

    // 把 MySQL C API 的 errno / sqlstate / 消息转换为 rowbind::Error.
    // 句柄上没有错误时仍返回 code 对应的错误, 消息只含 context.
    rowbind::Error errorFromMySqlHandle(MYSQL* handle, rowbind::ErrorCode code, const std::string& context);
    rowbind::Error errorFromStatementHandle(MYSQL_STMT* stmt_handle, rowbind::ErrorCode code, const std::string& context);

}  // namespace rowbind_mysql
