#ifndef ROWBIND_STMT_SCAN_H
#define ROWBIND_STMT_SCAN_H

#include <type_traits>
#include <utility>
#include <vector>

#include "rowbind/error.h"
#include "rowbind/scannable.h"
#include "rowbind/sql_value.h"
#include "rowbind/statement_executor.h"

namespace rowbind {

    // 执行 stmt 并把每一行依次扫描进 dst.newElement() 返回的新元素.
    // 遇到第一个错误即停止并返回它; 已追加的元素保留在 dst 中 (包括出错那一行分配的元素).
    // 只要取得了游标, 无论以何种方式退出都会恰好关闭一次.
    Error stmtScanAll(IStatementExecutor& stmt, IMultiScannable& dst, const std::vector<SqlValue>& args);

    template <typename... Args>
        requires(std::is_constructible_v<SqlValue, Args> && ...)
    Error stmtScanAll(IStatementExecutor& stmt, IMultiScannable& dst, Args&&... args) {
        std::vector<SqlValue> bound_args;
        bound_args.reserve(sizeof...(Args));
        (bound_args.emplace_back(std::forward<Args>(args)), ...);
        return stmtScanAll(stmt, dst, bound_args);
    }

    // 只扫描第一行. 没有行时返回游标的终止错误, 若没有则返回 RecordNotFound.
    Error stmtScanOne(IStatementExecutor& stmt, ISingleScannable& dst, const std::vector<SqlValue>& args);

    template <typename... Args>
        requires(std::is_constructible_v<SqlValue, Args> && ...)
    Error stmtScanOne(IStatementExecutor& stmt, ISingleScannable& dst, Args&&... args) {
        std::vector<SqlValue> bound_args;
        bound_args.reserve(sizeof...(Args));
        (bound_args.emplace_back(std::forward<Args>(args)), ...);
        return stmtScanOne(stmt, dst, bound_args);
    }

}  // namespace rowbind

#endif  // ROWBIND_STMT_SCAN_H
