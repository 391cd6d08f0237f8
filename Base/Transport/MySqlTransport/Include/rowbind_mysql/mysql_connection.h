// rowbind_mysql/mysql_connection.h
#pragma once

#include <mysql/mysql.h>

#include <expected>
#include <memory>
#include <string>

#include "rowbind/error.h"
#include "rowbind_mysql/mysql_connection_params.h"

namespace rowbind_mysql {

    class MySqlPreparedStatement;  // Forward declaration
    void ensure_mysql_library_initialized();
    void try_mysql_library_end();

    // 一个 MYSQL* 连接. 由它创建的预处理语句不得比连接活得更久.
    class MySqlConnection {
      public:
        MySqlConnection();
        ~MySqlConnection();

        MySqlConnection(const MySqlConnection&) = delete;
        MySqlConnection& operator=(const MySqlConnection&) = delete;
        MySqlConnection(MySqlConnection&&) = delete;
        MySqlConnection& operator=(MySqlConnection&&) = delete;

        rowbind::Error open(const MySqlConnectionParams& params);
        void close();
        bool isOpen() const;

        // 执行不返回结果集的语句 (DDL / DML)
        rowbind::Error executeDirect(const std::string& sql);

        std::expected<std::unique_ptr<MySqlPreparedStatement>, rowbind::Error> prepare(const std::string& sql);

        my_ulonglong affectedRows() const;
        std::string getServerVersionString() const;

        MYSQL* getNativeHandle() const {
            return m_mysql_handle;
        }
        const MySqlConnectionParams& getCurrentParams() const {
            return m_current_params;
        }

      private:
        rowbind::Error applyPreConnectOptions(const MySqlConnectionParams& params);

        MYSQL* m_mysql_handle = nullptr;
        bool m_is_open = false;
        MySqlConnectionParams m_current_params;
    };

}  // namespace rowbind_mysql
