// rowbind/sql_value_qvariant_interop.cpp
#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QTime>
#include <QTimeZone>

#include "rowbind/sql_value.h"

namespace rowbind {

    QVariant SqlValue::toQVariant() const {
        using namespace std::chrono;
        return std::visit(
            [](const auto& v) -> QVariant {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return QVariant();
                } else if constexpr (std::is_same_v<T, bool>) {
                    return QVariant(v);
                } else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, int16_t> || std::is_same_v<T, int32_t>) {
                    return QVariant(static_cast<int>(v));
                } else if constexpr (std::is_same_v<T, uint8_t> || std::is_same_v<T, uint16_t> || std::is_same_v<T, uint32_t>) {
                    return QVariant(static_cast<uint>(v));
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return QVariant(static_cast<qlonglong>(v));
                } else if constexpr (std::is_same_v<T, uint64_t>) {
                    return QVariant(static_cast<qulonglong>(v));
                } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                    return QVariant(v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return QVariant(QString::fromStdString(v));
                } else if constexpr (std::is_same_v<T, std::vector<unsigned char>>) {
                    return QVariant(QByteArray(reinterpret_cast<const char*>(v.data()), static_cast<qsizetype>(v.size())));
                } else if constexpr (std::is_same_v<T, ChronoDate>) {
                    return QVariant(QDate(static_cast<int>(v.year()), static_cast<int>(static_cast<unsigned>(v.month())), static_cast<int>(static_cast<unsigned>(v.day()))));
                } else if constexpr (std::is_same_v<T, ChronoTime>) {
                    // QTime 只能表示一天之内的非负时刻, 其余按文本返回
                    if (v < microseconds::zero() || v >= hours(24)) {
                        return QVariant(QString::fromStdString(text::formatTime(v)));
                    }
                    return QVariant(QTime::fromMSecsSinceStartOfDay(static_cast<int>(duration_cast<milliseconds>(v).count())));
                } else {
                    const auto ms = duration_cast<milliseconds>(v.time_since_epoch()).count();
                    return QVariant(QDateTime::fromMSecsSinceEpoch(ms, QTimeZone::utc()));
                }
            },
            m_storage);
    }

    SqlValue SqlValue::fromQVariant(const QVariant& qv) {
        using namespace std::chrono;
        if (!qv.isValid() || qv.isNull()) {
            return SqlValue();
        }
        switch (qv.typeId()) {
            case QMetaType::Bool:
                return SqlValue(qv.toBool());
            case QMetaType::Int:
                return SqlValue(static_cast<int32_t>(qv.toInt()));
            case QMetaType::UInt:
                return SqlValue(static_cast<uint32_t>(qv.toUInt()));
            case QMetaType::LongLong:
                return SqlValue(static_cast<int64_t>(qv.toLongLong()));
            case QMetaType::ULongLong:
                return SqlValue(static_cast<uint64_t>(qv.toULongLong()));
            case QMetaType::Float:
                return SqlValue(qv.toFloat());
            case QMetaType::Double:
                return SqlValue(qv.toDouble());
            case QMetaType::QString:
                return SqlValue(qv.toString().toStdString());
            case QMetaType::QByteArray: {
                const QByteArray bytes = qv.toByteArray();
                return SqlValue(std::vector<unsigned char>(bytes.begin(), bytes.end()));
            }
            case QMetaType::QDate: {
                const QDate d = qv.toDate();
                return SqlValue(ChronoDate{year{d.year()}, month{static_cast<unsigned>(d.month())}, day{static_cast<unsigned>(d.day())}});
            }
            case QMetaType::QTime: {
                const QTime t = qv.toTime();
                return SqlValue(ChronoTime(milliseconds(t.msecsSinceStartOfDay())));
            }
            case QMetaType::QDateTime: {
                const QDateTime dt = qv.toDateTime();
                return SqlValue(ChronoDateTime(duration_cast<system_clock::duration>(milliseconds(dt.toMSecsSinceEpoch()))));
            }
            default:
                // 其他类型尽量转为字符串
                if (qv.canConvert<QString>()) {
                    return SqlValue(qv.toString().toStdString());
                }
                return SqlValue();
        }
    }

}  // namespace rowbind
