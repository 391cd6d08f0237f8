// rowbind_mysql/mysql_connection_core.cpp
#include <mysql/mysql.h>

#include <atomic>
#include <mutex>
#include <stdexcept>

#include "rowbind/config/rowbind_config.h"
#include "rowbind_mysql/mysql_connection.h"
#include "rowbind_mysql/mysql_error_reporting.h"
#include "rowbind_mysql/mysql_prepared_statement.h"

namespace rowbind_mysql {

    using rowbind::Error;
    using rowbind::ErrorCode;

    static std::atomic<int> g_mysql_library_init_count(0);
    static std::mutex g_mysql_library_mutex;

    void ensure_mysql_library_initialized() {
        std::lock_guard<std::mutex> lock(g_mysql_library_mutex);
        if (g_mysql_library_init_count.fetch_add(1, std::memory_order_relaxed) == 0) {
            if (mysql_library_init(0, nullptr, nullptr)) {
                g_mysql_library_init_count.fetch_sub(1, std::memory_order_relaxed);
                throw std::runtime_error("Failed to initialize MySQL C library");
            }
        }
    }

    void try_mysql_library_end() {
        std::lock_guard<std::mutex> lock(g_mysql_library_mutex);
        if (g_mysql_library_init_count.load(std::memory_order_relaxed) > 0) {
            if (g_mysql_library_init_count.fetch_sub(1, std::memory_order_relaxed) == 1) {
                mysql_library_end();
            }
        }
    }

    MySqlConnection::MySqlConnection() {
        ensure_mysql_library_initialized();
    }

    MySqlConnection::~MySqlConnection() {
        close();
        try_mysql_library_end();
    }

    Error MySqlConnection::open(const MySqlConnectionParams& params) {
        if (m_is_open) {
            return Error(ErrorCode::ConnectionError, "Already connected. Close first.");
        }
        if (!m_mysql_handle) {
            m_mysql_handle = mysql_init(nullptr);
            if (!m_mysql_handle) {
                return Error(ErrorCode::ConnectionError, "mysql_init() failed (out of memory?)");
            }
        }
        m_current_params = params;

        Error option_err = applyPreConnectOptions(params);
        if (option_err) {
            close();
            return option_err;
        }

        const char* host_ptr = params.host.empty() ? nullptr : params.host.c_str();
        const char* user_ptr = params.user.empty() ? nullptr : params.user.c_str();
        const char* passwd_ptr = params.password.empty() ? nullptr : params.password.c_str();
        const char* db_ptr = params.db_name.empty() ? nullptr : params.db_name.c_str();
        unsigned int port_val = params.port == 0 ? MySqlConnectionParams::DEFAULT_PORT : params.port;
        const char* unix_socket_ptr = params.unix_socket.empty() ? nullptr : params.unix_socket.c_str();

        if (!mysql_real_connect(m_mysql_handle, host_ptr, user_ptr, passwd_ptr, db_ptr, port_val, unix_socket_ptr, params.client_flag)) {
            Error err = errorFromMySqlHandle(m_mysql_handle, ErrorCode::ConnectionError, "mysql_real_connect failed");
            close();
            return err;
        }
        m_is_open = true;

        auto logger = rowbind::config::getLogger();
        if (logger) logger->debug("[MySqlConnection {}] Connected to {}:{} (server {}).", (void*)this, params.host, port_val, getServerVersionString());
        return rowbind::make_ok();
    }

    void MySqlConnection::close() {
        bool was_open = m_is_open;
        m_is_open = false;
        if (m_mysql_handle) {
            mysql_close(m_mysql_handle);
            m_mysql_handle = nullptr;
        }
        if (was_open) {
            auto logger = rowbind::config::getLogger();
            if (logger) logger->debug("[MySqlConnection {}] Closed.", (void*)this);
        }
    }

    bool MySqlConnection::isOpen() const {
        return m_is_open && m_mysql_handle;
    }

    Error MySqlConnection::executeDirect(const std::string& sql) {
        if (!isOpen()) {
            return Error(ErrorCode::ConnectionError, "Not connected for executeDirect.");
        }
        if (mysql_real_query(m_mysql_handle, sql.c_str(), sql.length()) != 0) {
            return errorFromMySqlHandle(m_mysql_handle, ErrorCode::ExecutionError, "mysql_real_query failed");
        }
        // 丢弃可能产生的结果集
        do {
            MYSQL_RES* res = mysql_store_result(m_mysql_handle);
            if (res) {
                mysql_free_result(res);
            } else if (mysql_field_count(m_mysql_handle) != 0) {
                return errorFromMySqlHandle(m_mysql_handle, ErrorCode::ExecutionError, "mysql_store_result failed");
            }
            int next_rc = mysql_next_result(m_mysql_handle);
            if (next_rc > 0) {
                return errorFromMySqlHandle(m_mysql_handle, ErrorCode::ExecutionError, "mysql_next_result failed");
            }
            if (next_rc != 0) break;
        } while (true);
        return rowbind::make_ok();
    }

    std::expected<std::unique_ptr<MySqlPreparedStatement>, Error> MySqlConnection::prepare(const std::string& sql) {
        if (!isOpen()) {
            return std::unexpected(Error(ErrorCode::ConnectionError, "Not connected for prepare."));
        }
        MYSQL_STMT* stmt_handle = mysql_stmt_init(m_mysql_handle);
        if (!stmt_handle) {
            return std::unexpected(errorFromMySqlHandle(m_mysql_handle, ErrorCode::ExecutionError, "mysql_stmt_init failed"));
        }
        if (mysql_stmt_prepare(stmt_handle, sql.c_str(), sql.length()) != 0) {
            Error err = errorFromStatementHandle(stmt_handle, ErrorCode::ExecutionError, "mysql_stmt_prepare failed");
            mysql_stmt_close(stmt_handle);
            return std::unexpected(err);
        }
        bool update_max_length = true;
        if (mysql_stmt_attr_set(stmt_handle, STMT_ATTR_UPDATE_MAX_LENGTH, &update_max_length) != 0) {
            Error err = errorFromStatementHandle(stmt_handle, ErrorCode::ExecutionError, "mysql_stmt_attr_set(STMT_ATTR_UPDATE_MAX_LENGTH) failed");
            mysql_stmt_close(stmt_handle);
            return std::unexpected(err);
        }
        return std::make_unique<MySqlPreparedStatement>(stmt_handle, sql);
    }

    my_ulonglong MySqlConnection::affectedRows() const {
        return m_mysql_handle ? mysql_affected_rows(m_mysql_handle) : 0;
    }

    std::string MySqlConnection::getServerVersionString() const {
        if (!m_mysql_handle) return "";
        const char* info = mysql_get_server_info(m_mysql_handle);
        return info ? std::string(info) : std::string();
    }

}  // namespace rowbind_mysql
