// rowbind_mysql/mysql_connection_options.cpp
#include <mysql/mysql.h>

#include "rowbind_mysql/mysql_connection.h"
#include "rowbind_mysql/mysql_error_reporting.h"

namespace rowbind_mysql {

    using rowbind::Error;
    using rowbind::ErrorCode;

    Error MySqlConnection::applyPreConnectOptions(const MySqlConnectionParams& params) {
        if (!m_mysql_handle) {
            return Error(ErrorCode::InternalError, "Null MySQL handle while applying options.");
        }

        auto set_mysql_opt_uint = [&](mysql_option option, unsigned int arg, const std::string& opt_name) -> Error {
            if (mysql_options(m_mysql_handle, option, &arg) != 0) {
                return errorFromMySqlHandle(m_mysql_handle, ErrorCode::ConnectionError, "Pre-connect option failure: failed to set " + opt_name);
            }
            return rowbind::make_ok();
        };

        if (params.connect_timeout_seconds.has_value()) {
            if (Error err = set_mysql_opt_uint(MYSQL_OPT_CONNECT_TIMEOUT, params.connect_timeout_seconds.value(), "MYSQL_OPT_CONNECT_TIMEOUT")) return err;
        }
        if (params.read_timeout_seconds.has_value()) {
            if (Error err = set_mysql_opt_uint(MYSQL_OPT_READ_TIMEOUT, params.read_timeout_seconds.value(), "MYSQL_OPT_READ_TIMEOUT")) return err;
        }
        if (params.write_timeout_seconds.has_value()) {
            if (Error err = set_mysql_opt_uint(MYSQL_OPT_WRITE_TIMEOUT, params.write_timeout_seconds.value(), "MYSQL_OPT_WRITE_TIMEOUT")) return err;
        }

        if (params.charset.has_value() && !params.charset->empty()) {
            if (mysql_options(m_mysql_handle, MYSQL_SET_CHARSET_NAME, params.charset->c_str()) != 0) {
                return errorFromMySqlHandle(m_mysql_handle, ErrorCode::ConnectionError, "Pre-connect option failure: failed to set MYSQL_SET_CHARSET_NAME to " + *params.charset);
            }
        }
        return rowbind::make_ok();
    }

}  // namespace rowbind_mysql
