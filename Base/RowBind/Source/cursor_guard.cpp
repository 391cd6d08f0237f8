// rowbind/cursor_guard.cpp
#include "rowbind/cursor_guard.h"

#include <utility>  // For std::move

#include "rowbind/config/rowbind_config.h"

namespace rowbind {

    CursorGuard::CursorGuard(std::unique_ptr<IRowCursor> cursor) : m_cursor(std::move(cursor)) {
        auto logger = config::getLogger();
        if (logger) logger->trace("[CursorGuard {}] Acquired cursor {}.", (void*)this, (void*)m_cursor.get());
    }

    CursorGuard::~CursorGuard() {
        if (m_released || !m_cursor) {
            return;
        }
        // 只有异常路径会走到这里
        m_released = true;
        Error close_err = m_cursor->close();
        auto logger = config::getLogger();
        if (close_err && logger) {
            logger->warn("[CursorGuard {}] Closing cursor during unwind failed: {}", (void*)this, close_err.toString());
        } else if (logger) {
            logger->trace("[CursorGuard {}] Cursor closed during unwind.", (void*)this);
        }
    }

    Error CursorGuard::finish(Error pending) {
        if (m_released || !m_cursor) {
            return pending;
        }
        m_released = true;
        Error close_err = m_cursor->close();
        if (!close_err) {
            return pending;
        }
        if (pending) {
            auto logger = config::getLogger();
            if (logger) logger->warn("[CursorGuard {}] Cursor close failed after earlier error, dropping it: {}", (void*)this, close_err.toString());
            return pending;
        }
        if (close_err.code != ErrorCode::CursorReleaseError) {
            close_err.message = std::string(errorCodeName(close_err.code)) + " while releasing cursor: " + close_err.message;
            close_err.code = ErrorCode::CursorReleaseError;
        }
        return close_err;
    }

}  // namespace rowbind
