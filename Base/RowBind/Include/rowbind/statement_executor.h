// rowbind/statement_executor.h
#pragma once
#include <expected>
#include <memory>
#include <vector>

#include "rowbind/error.h"
#include "rowbind/row_cursor.h"
#include "rowbind/sql_value.h"

namespace rowbind {

    // 已准备好的语句: 用给定的绑定参数执行并返回行游标.
    class IStatementExecutor {
      public:
        virtual ~IStatementExecutor() = default;

        virtual std::expected<std::unique_ptr<IRowCursor>, Error> executeQuery(const std::vector<SqlValue>& args) = 0;
    };

}  // namespace rowbind
