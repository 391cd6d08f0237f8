#include "rowbind/error.h"

namespace rowbind {

    const char* errorCodeName(ErrorCode code) {
        switch (code) {
            case ErrorCode::Ok:
                return "Ok";
            case ErrorCode::ExecutionError:
                return "ExecutionError";
            case ErrorCode::ScanError:
                return "ScanError";
            case ErrorCode::TerminalCursorError:
                return "TerminalCursorError";
            case ErrorCode::CursorReleaseError:
                return "CursorReleaseError";
            case ErrorCode::RecordNotFound:
                return "RecordNotFound";
            case ErrorCode::ConnectionError:
                return "ConnectionError";
            case ErrorCode::InvalidArgument:
                return "InvalidArgument";
            case ErrorCode::InternalError:
                return "InternalError";
        }
        return "UnknownError";
    }

    std::string Error::toString() const {
        std::string err_str = std::string("Error Code: ") + errorCodeName(code);
        if (!message.empty()) {
            err_str += ", Message: " + message;
        }
        if (row_index) {
            err_str += ", Row: " + std::to_string(*row_index);
        }
        if (column_index) {
            err_str += ", Column: " + std::to_string(*column_index);
        }
        if (native_db_error_code != 0) {
            err_str += ", DB Error: " + std::to_string(native_db_error_code);
        }
        if (!sql_state.empty()) {
            err_str += ", SQLState: " + sql_state;
        }
        return err_str;
    }

}  // namespace rowbind
