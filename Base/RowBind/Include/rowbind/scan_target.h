// rowbind/scan_target.h
#pragma once
#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QString>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "rowbind/error.h"
#include "rowbind/sql_value.h"

namespace rowbind {

    namespace detail {
        template <typename T, typename Variant>
        struct is_variant_alternative : std::false_type {};

        template <typename T, typename... Ts>
        struct is_variant_alternative<T, std::variant<Ts...>> : std::disjunction<std::is_same<T, Ts>...> {};
    }  // namespace detail

    // 一个可写入的列槽位: 指向记录字段的非拥有指针.
    // ScanTarget 只在一次 scan 调用期间有效, 不得保存.
    class ScanTarget {
      public:
        using Slot = std::variant<bool*,
                                  int8_t*,
                                  uint8_t*,
                                  int16_t*,
                                  uint16_t*,
                                  int32_t*,
                                  uint32_t*,
                                  int64_t*,
                                  uint64_t*,
                                  float*,
                                  double*,
                                  std::string*,
                                  std::vector<unsigned char>*,
                                  SqlValue::ChronoDate*,
                                  SqlValue::ChronoTime*,
                                  SqlValue::ChronoDateTime*,
                                  QString*,
                                  QByteArray*,
                                  QDate*,
                                  QDateTime*,
                                  SqlValue*,
                                  // 可为 NULL 的列
                                  std::optional<bool>*,
                                  std::optional<int32_t>*,
                                  std::optional<int64_t>*,
                                  std::optional<uint64_t>*,
                                  std::optional<double>*,
                                  std::optional<std::string>*,
                                  std::optional<SqlValue::ChronoDate>*,
                                  std::optional<SqlValue::ChronoDateTime>*>;

        template <typename T>
            requires detail::is_variant_alternative<T*, Slot>::value
        ScanTarget(T* field) : m_slot(std::in_place_type<T*>, field) {
        }

        // 按转换规则把一个列值写入目标字段, 失败返回 ScanError
        Error assign(const SqlValue& value) const;

        bool isNullable() const;
        const char* targetTypeName() const;

        const Slot& slot() const {
            return m_slot;
        }

      private:
        Slot m_slot;
    };

}  // namespace rowbind
