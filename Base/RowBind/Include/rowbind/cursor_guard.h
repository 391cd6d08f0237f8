// rowbind/cursor_guard.h
#pragma once
#include <memory>

#include "rowbind/error.h"
#include "rowbind/row_cursor.h"

namespace rowbind {

    // 持有一个已获得的游标, 保证 close() 在任意退出路径上恰好调用一次.
    class CursorGuard {
      public:
        explicit CursorGuard(std::unique_ptr<IRowCursor> cursor);
        ~CursorGuard();

        CursorGuard(const CursorGuard&) = delete;
        CursorGuard& operator=(const CursorGuard&) = delete;
        CursorGuard(CursorGuard&&) = delete;
        CursorGuard& operator=(CursorGuard&&) = delete;

        IRowCursor& cursor() {
            return *m_cursor;
        }

        // 关闭游标并合并结果: pending 出错时原样返回 (关闭失败只记日志),
        // 否则返回关闭本身的错误.
        Error finish(Error pending);

        bool isReleased() const {
            return m_released;
        }

      private:
        std::unique_ptr<IRowCursor> m_cursor;
        bool m_released = false;
    };

}  // namespace rowbind
