// rowbind/scan_target_assign.cpp
#include <QTimeZone>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <utility>  // For std::in_range

#include "rowbind/scan_target.h"

namespace rowbind {

    namespace {

        template <typename T>
        struct TargetName;
        template <>
        struct TargetName<bool> {
            static constexpr const char* value = "bool";
        };
        template <>
        struct TargetName<int8_t> {
            static constexpr const char* value = "int8_t";
        };
        template <>
        struct TargetName<uint8_t> {
            static constexpr const char* value = "uint8_t";
        };
        template <>
        struct TargetName<int16_t> {
            static constexpr const char* value = "int16_t";
        };
        template <>
        struct TargetName<uint16_t> {
            static constexpr const char* value = "uint16_t";
        };
        template <>
        struct TargetName<int32_t> {
            static constexpr const char* value = "int32_t";
        };
        template <>
        struct TargetName<uint32_t> {
            static constexpr const char* value = "uint32_t";
        };
        template <>
        struct TargetName<int64_t> {
            static constexpr const char* value = "int64_t";
        };
        template <>
        struct TargetName<uint64_t> {
            static constexpr const char* value = "uint64_t";
        };
        template <>
        struct TargetName<float> {
            static constexpr const char* value = "float";
        };
        template <>
        struct TargetName<double> {
            static constexpr const char* value = "double";
        };
        template <>
        struct TargetName<std::string> {
            static constexpr const char* value = "std::string";
        };
        template <>
        struct TargetName<std::vector<unsigned char>> {
            static constexpr const char* value = "std::vector<unsigned char>";
        };
        template <>
        struct TargetName<SqlValue::ChronoDate> {
            static constexpr const char* value = "std::chrono::year_month_day";
        };
        template <>
        struct TargetName<SqlValue::ChronoTime> {
            static constexpr const char* value = "std::chrono::microseconds";
        };
        template <>
        struct TargetName<SqlValue::ChronoDateTime> {
            static constexpr const char* value = "std::chrono::system_clock::time_point";
        };
        template <>
        struct TargetName<QString> {
            static constexpr const char* value = "QString";
        };
        template <>
        struct TargetName<QByteArray> {
            static constexpr const char* value = "QByteArray";
        };
        template <>
        struct TargetName<QDate> {
            static constexpr const char* value = "QDate";
        };
        template <>
        struct TargetName<QDateTime> {
            static constexpr const char* value = "QDateTime";
        };
        template <>
        struct TargetName<SqlValue> {
            static constexpr const char* value = "SqlValue";
        };
        template <typename T>
        struct TargetName<std::optional<T>> {
            static constexpr const char* value = TargetName<T>::value;
        };

        template <typename T>
        struct is_optional : std::false_type {};
        template <typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

        Error unsupported(const SqlValue& value, const char* target) {
            return Error(ErrorCode::ScanError, std::string("cannot scan ") + value.typeName() + " value into " + target);
        }

        Error outOfRange(const SqlValue& value, const char* target) {
            return Error(ErrorCode::ScanError, "value " + value.toString() + " (" + value.typeName() + ") out of range for " + target);
        }

        Error unparsable(const SqlValue& value, const char* target) {
            return Error(ErrorCode::ScanError, "cannot parse string \"" + value.toString() + "\" as " + target);
        }

        template <typename T>
        Error convertIntegral(const SqlValue& value, T& out) {
            constexpr const char* name = TargetName<T>::value;
            if (const bool* b = value.get_if<bool>()) {
                out = static_cast<T>(*b ? 1 : 0);
                return make_ok();
            }
            if (value.isIntegral()) {
                bool fits = false;
                T converted{};
                std::visit(
                    [&](const auto& v) {
                        using S = std::decay_t<decltype(v)>;
                        if constexpr (std::is_integral_v<S> && !std::is_same_v<S, bool>) {
                            if (std::in_range<T>(v)) {
                                fits = true;
                                converted = static_cast<T>(v);
                            }
                        }
                    },
                    value.storage());
                if (!fits) return outOfRange(value, name);
                out = converted;
                return make_ok();
            }
            if (value.isFloatingPoint()) {
                const double d = value.type() == SqlValueType::Float ? static_cast<double>(*value.get_if<float>()) : *value.get_if<double>();
                if (!std::isfinite(d) || std::trunc(d) != d) {
                    return Error(ErrorCode::ScanError, "cannot scan non-integral " + value.toString() + " into " + name);
                }
                // max() + 1 对 64 位类型等于 2^63 / 2^64, 可精确表示
                const double lower = static_cast<double>(std::numeric_limits<T>::min());
                const double upper = static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
                if (d < lower || d >= upper) return outOfRange(value, name);
                out = static_cast<T>(d);
                return make_ok();
            }
            if (const std::string* s = value.get_if<std::string>()) {
                T parsed{};
                const char* end = s->data() + s->size();
                auto [ptr, ec] = std::from_chars(s->data(), end, parsed, 10);
                if (ec == std::errc::result_out_of_range) return outOfRange(value, name);
                if (ec != std::errc() || ptr != end || s->empty()) return unparsable(value, name);
                out = parsed;
                return make_ok();
            }
            return unsupported(value, name);
        }

        template <typename T>
        Error convertFloating(const SqlValue& value, T& out) {
            constexpr const char* name = TargetName<T>::value;
            if (value.isIntegral() || value.isFloatingPoint()) {
                std::visit(
                    [&](const auto& v) {
                        using S = std::decay_t<decltype(v)>;
                        if constexpr (std::is_arithmetic_v<S> && !std::is_same_v<S, bool>) {
                            out = static_cast<T>(v);
                        }
                    },
                    value.storage());
                return make_ok();
            }
            if (const std::string* s = value.get_if<std::string>()) {
                T parsed{};
                const char* end = s->data() + s->size();
                auto [ptr, ec] = std::from_chars(s->data(), end, parsed);
                if (ec == std::errc::result_out_of_range) return outOfRange(value, name);
                if (ec != std::errc() || ptr != end || s->empty()) return unparsable(value, name);
                out = parsed;
                return make_ok();
            }
            return unsupported(value, name);
        }

        Error convertBool(const SqlValue& value, bool& out) {
            if (const bool* b = value.get_if<bool>()) {
                out = *b;
                return make_ok();
            }
            if (value.isIntegral()) {
                int64_t as_int = 0;
                if (Error err = convertIntegral(value, as_int); err || (as_int != 0 && as_int != 1)) {
                    return Error(ErrorCode::ScanError, "cannot scan " + value.toString() + " into bool, expected 0 or 1");
                }
                out = as_int == 1;
                return make_ok();
            }
            if (const std::string* s = value.get_if<std::string>()) {
                std::string lower(*s);
                std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
                    return static_cast<char>(std::tolower(c));
                });
                if (lower == "1" || lower == "t" || lower == "true") {
                    out = true;
                    return make_ok();
                }
                if (lower == "0" || lower == "f" || lower == "false") {
                    out = false;
                    return make_ok();
                }
                return unparsable(value, "bool");
            }
            return unsupported(value, "bool");
        }

        Error convertString(const SqlValue& value, std::string& out) {
            out = value.toString();
            return make_ok();
        }

        Error convertBytes(const SqlValue& value, std::vector<unsigned char>& out) {
            if (const auto* bytes = value.get_if<std::vector<unsigned char>>()) {
                out = *bytes;
                return make_ok();
            }
            if (const std::string* s = value.get_if<std::string>()) {
                out.assign(s->begin(), s->end());
                return make_ok();
            }
            return unsupported(value, TargetName<std::vector<unsigned char>>::value);
        }

        Error convertDate(const SqlValue& value, SqlValue::ChronoDate& out) {
            using namespace std::chrono;
            if (const auto* date = value.get_if<SqlValue::ChronoDate>()) {
                out = *date;
                return make_ok();
            }
            if (const auto* dt = value.get_if<SqlValue::ChronoDateTime>()) {
                out = year_month_day{floor<days>(*dt)};
                return make_ok();
            }
            if (const std::string* s = value.get_if<std::string>()) {
                SqlValue::ChronoDateTime dt;
                if (text::parseDate(*s, out)) return make_ok();
                if (text::parseDateTime(*s, dt)) {
                    out = year_month_day{floor<days>(dt)};
                    return make_ok();
                }
                return unparsable(value, TargetName<SqlValue::ChronoDate>::value);
            }
            return unsupported(value, TargetName<SqlValue::ChronoDate>::value);
        }

        Error convertTime(const SqlValue& value, SqlValue::ChronoTime& out) {
            if (const auto* t = value.get_if<SqlValue::ChronoTime>()) {
                out = *t;
                return make_ok();
            }
            if (const std::string* s = value.get_if<std::string>()) {
                if (text::parseTime(*s, out)) return make_ok();
                return unparsable(value, TargetName<SqlValue::ChronoTime>::value);
            }
            return unsupported(value, TargetName<SqlValue::ChronoTime>::value);
        }

        Error convertDateTime(const SqlValue& value, SqlValue::ChronoDateTime& out) {
            using namespace std::chrono;
            if (const auto* dt = value.get_if<SqlValue::ChronoDateTime>()) {
                out = *dt;
                return make_ok();
            }
            if (const auto* date = value.get_if<SqlValue::ChronoDate>()) {
                out = time_point_cast<system_clock::duration>(sys_days{*date});
                return make_ok();
            }
            if (const std::string* s = value.get_if<std::string>()) {
                if (text::parseDateTime(*s, out)) return make_ok();
                return unparsable(value, TargetName<SqlValue::ChronoDateTime>::value);
            }
            return unsupported(value, TargetName<SqlValue::ChronoDateTime>::value);
        }

        // 非 NULL 值写入普通目标
        template <typename T>
        Error convertValue(const SqlValue& value, T& out) {
            if constexpr (std::is_same_v<T, bool>) {
                return convertBool(value, out);
            } else if constexpr (std::is_integral_v<T>) {
                return convertIntegral(value, out);
            } else if constexpr (std::is_floating_point_v<T>) {
                return convertFloating(value, out);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return convertString(value, out);
            } else if constexpr (std::is_same_v<T, std::vector<unsigned char>>) {
                return convertBytes(value, out);
            } else if constexpr (std::is_same_v<T, SqlValue::ChronoDate>) {
                return convertDate(value, out);
            } else if constexpr (std::is_same_v<T, SqlValue::ChronoTime>) {
                return convertTime(value, out);
            } else if constexpr (std::is_same_v<T, SqlValue::ChronoDateTime>) {
                return convertDateTime(value, out);
            } else if constexpr (std::is_same_v<T, QString>) {
                out = QString::fromStdString(value.toString());
                return make_ok();
            } else if constexpr (std::is_same_v<T, QByteArray>) {
                std::vector<unsigned char> bytes;
                if (Error err = convertBytes(value, bytes)) {
                    return unsupported(value, TargetName<QByteArray>::value);
                }
                out = QByteArray(reinterpret_cast<const char*>(bytes.data()), static_cast<qsizetype>(bytes.size()));
                return make_ok();
            } else if constexpr (std::is_same_v<T, QDate>) {
                SqlValue::ChronoDate date;
                if (Error err = convertDate(value, date)) {
                    return err;
                }
                out = QDate(static_cast<int>(date.year()), static_cast<int>(static_cast<unsigned>(date.month())), static_cast<int>(static_cast<unsigned>(date.day())));
                return make_ok();
            } else if constexpr (std::is_same_v<T, QDateTime>) {
                using namespace std::chrono;
                SqlValue::ChronoDateTime dt;
                if (Error err = convertDateTime(value, dt)) {
                    return err;
                }
                out = QDateTime::fromMSecsSinceEpoch(duration_cast<milliseconds>(dt.time_since_epoch()).count(), QTimeZone::utc());
                return make_ok();
            } else {
                static_assert(std::is_same_v<T, SqlValue>, "unhandled scan target type");
                out = value;
                return make_ok();
            }
        }

    }  // namespace

    Error ScanTarget::assign(const SqlValue& value) const {
        return std::visit(
            [&value](auto* field) -> Error {
                using Field = std::remove_pointer_t<decltype(field)>;
                if (!field) {
                    return Error(ErrorCode::ScanError, std::string("destination pointer for ") + TargetName<Field>::value + " is null");
                }
                if constexpr (std::is_same_v<Field, SqlValue>) {
                    *field = value;
                    return make_ok();
                } else if constexpr (is_optional<Field>::value) {
                    if (value.isNull()) {
                        field->reset();
                        return make_ok();
                    }
                    typename Field::value_type converted{};
                    if (Error err = convertValue(value, converted)) {
                        return err;
                    }
                    *field = std::move(converted);
                    return make_ok();
                } else {
                    if (value.isNull()) {
                        return Error(ErrorCode::ScanError, std::string("cannot scan NULL into ") + TargetName<Field>::value + ", use std::optional for nullable columns");
                    }
                    return convertValue(value, *field);
                }
            },
            m_slot);
    }

    bool ScanTarget::isNullable() const {
        return std::visit(
            [](auto* field) {
                using Field = std::remove_pointer_t<decltype(field)>;
                return is_optional<Field>::value || std::is_same_v<Field, SqlValue>;
            },
            m_slot);
    }

    const char* ScanTarget::targetTypeName() const {
        return std::visit(
            [](auto* field) {
                using Field = std::remove_pointer_t<decltype(field)>;
                return TargetName<Field>::value;
            },
            m_slot);
    }

}  // namespace rowbind
