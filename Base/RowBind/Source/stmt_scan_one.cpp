#include <memory>
#include <utility>

#include "rowbind/config/rowbind_config.h"
#include "rowbind/cursor_guard.h"
#include "rowbind/stmt_scan.h"

namespace rowbind {

    Error stmtScanOne(IStatementExecutor& stmt, ISingleScannable& dst, const std::vector<SqlValue>& args) {
        auto logger = config::getLogger();

        auto cursor_result = stmt.executeQuery(args);
        if (!cursor_result) {
            return cursor_result.error();
        }
        if (!*cursor_result) {
            return Error(ErrorCode::InternalError, "stmtScanOne: executor returned a null cursor");
        }

        CursorGuard guard(std::move(*cursor_result));
        IRowCursor& cursor = guard.cursor();

        std::size_t row_count = 0;
        Error pending;
        if (cursor.next()) {
            pending = cursor.scan(dst.scanTargets());
            if (pending) {
                if (logger) logger->trace("stmtScanOne: scan failed at row 0.");
            } else {
                if (logger) logger->trace("stmtScanOne: row 0 bound.");
                row_count = 1;
            }
        } else {
            // 终止错误优先于 RecordNotFound
            pending = cursor.lastError();
            if (!pending) {
                pending = Error(ErrorCode::RecordNotFound, "stmtScanOne: query returned no rows");
            }
        }

        Error result = guard.finish(std::move(pending));
        if (logger) logger->debug("stmtScanOne: finished after {} row(s), status {}.", row_count, errorCodeName(result.code));
        return result;
    }

}  // namespace rowbind
