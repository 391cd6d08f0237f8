// rowbind/row_cursor.h
#pragma once
#include <vector>

#include "rowbind/error.h"
#include "rowbind/scan_target.h"

namespace rowbind {

    // 一次查询执行产生的只进, 单遍结果流.
    class IRowCursor {
      public:
        virtual ~IRowCursor() = default;

        // 前进到下一行. 没有更多行或发生错误时返回 false, 错误由 lastError() 给出.
        virtual bool next() = 0;

        // 按位置把当前行的各列写入 targets.
        virtual Error scan(const std::vector<ScanTarget>& targets) = 0;

        // 迭代过程中累积的终止错误 (例如传输层故障), 没有则为 Ok.
        virtual Error lastError() const = 0;

        // 释放游标持有的资源. 可重复调用, 之后的调用返回 Ok.
        // 会在析构和栈展开过程中被调用, 失败只能通过返回值报告.
        virtual Error close() noexcept = 0;
    };

}  // namespace rowbind
