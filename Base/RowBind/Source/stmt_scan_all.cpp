#include <memory>
#include <utility>

#include "rowbind/config/rowbind_config.h"
#include "rowbind/cursor_guard.h"
#include "rowbind/stmt_scan.h"

namespace rowbind {

    Error stmtScanAll(IStatementExecutor& stmt, IMultiScannable& dst, const std::vector<SqlValue>& args) {
        auto logger = config::getLogger();

        auto cursor_result = stmt.executeQuery(args);
        if (!cursor_result) {
            return cursor_result.error();
        }
        if (!*cursor_result) {
            return Error(ErrorCode::InternalError, "stmtScanAll: executor returned a null cursor");
        }

        CursorGuard guard(std::move(*cursor_result));
        IRowCursor& cursor = guard.cursor();

        std::size_t row_count = 0;
        Error pending;
        while (cursor.next()) {
            ISingleScannable& element = dst.newElement();
            pending = cursor.scan(element.scanTargets());
            if (pending) {
                if (logger) logger->trace("stmtScanAll: scan failed at row {}.", row_count);
                break;
            }
            if (logger) logger->trace("stmtScanAll: row {} bound.", row_count);
            ++row_count;
        }
        if (!pending) {
            pending = cursor.lastError();
        }

        Error result = guard.finish(std::move(pending));
        if (logger) logger->debug("stmtScanAll: finished after {} row(s), status {}.", row_count, errorCodeName(result.code));
        return result;
    }

}  // namespace rowbind
