#ifndef ROWBIND_ERROR_H
#define ROWBIND_ERROR_H

#include <cstddef>
#include <optional>
#include <string>

namespace rowbind {

    // 错误码枚举
    enum class ErrorCode {
        Ok = 0,
        // 查询无法启动 (参数错误, 后端不可用, 语句误用)
        ExecutionError,
        // 单行无法写入目标字段 (列数不符, 类型不兼容, 转换失败)
        ScanError,
        // 行耗尽之后才发现的游标错误
        TerminalCursorError,
        // 释放游标失败
        CursorReleaseError,
        RecordNotFound,
        ConnectionError,
        InvalidArgument,
        InternalError,
    };

    const char* errorCodeName(ErrorCode code);

    struct Error {
        ErrorCode code = ErrorCode::Ok;
        std::string message;
        int native_db_error_code = 0;  // 可选的数据库原生错误码
        std::string sql_state;         // 可选的 SQLSTATE
        std::optional<std::size_t> row_index;
        std::optional<std::size_t> column_index;

        Error() = default;
        Error(ErrorCode c, std::string msg = "", int native_code = 0, std::string state = "") : code(c), message(std::move(msg)), native_db_error_code(native_code), sql_state(std::move(state)) {
        }

        bool isOk() const {
            return code == ErrorCode::Ok;
        }

        // if (err) { ... } 表示出错
        explicit operator bool() const {
            return !isOk();
        }

        Error& atRow(std::size_t row) {
            row_index = row;
            return *this;
        }

        Error& atColumn(std::size_t column) {
            column_index = column;
            return *this;
        }

        std::string toString() const;
    };

    inline Error make_ok() {
        return Error(ErrorCode::Ok);
    }

}  // namespace rowbind

#endif  // ROWBIND_ERROR_H
