// rowbind_mysql/mysql_param_encoding.cpp
#include <cstring>  // For std::memset, std::memcpy
#include <string>
#include <type_traits>
#include <variant>

#include "rowbind_mysql/mysql_value_codec.h"

namespace rowbind_mysql {

    using rowbind::Error;
    using rowbind::ErrorCode;
    using rowbind::SqlValue;

    namespace {

        template <typename T>
        void storeFixed(MYSQL_BIND& bind, std::vector<unsigned char>& storage, enum enum_field_types type, bool is_unsigned, const T& value) {
            storage.resize(sizeof(T));
            std::memcpy(storage.data(), &value, sizeof(T));
            bind.buffer_type = type;
            bind.buffer = storage.data();
            bind.buffer_length = sizeof(T);
            bind.is_unsigned = is_unsigned;
        }

        void storeBytes(MYSQL_BIND& bind, std::vector<unsigned char>& storage, unsigned long* length, enum enum_field_types type, const unsigned char* data, std::size_t size) {
            storage.assign(data, data + size);
            bind.buffer_type = type;
            bind.buffer = storage.data();
            bind.buffer_length = static_cast<unsigned long>(storage.size());
            if (length) {
                *length = static_cast<unsigned long>(storage.size());
                bind.length = length;
            }
        }

    }  // namespace

    Error encodeParamValue(const SqlValue& value, MYSQL_BIND& bind, std::vector<unsigned char>& storage, unsigned long* length) {
        std::memset(&bind, 0, sizeof(MYSQL_BIND));
        storage.clear();

        return std::visit(
            [&](const auto& v) -> Error {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    bind.buffer_type = MYSQL_TYPE_NULL;
                } else if constexpr (std::is_same_v<T, bool>) {
                    storeFixed(bind, storage, MYSQL_TYPE_TINY, false, static_cast<int8_t>(v ? 1 : 0));
                } else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, uint8_t>) {
                    storeFixed(bind, storage, MYSQL_TYPE_TINY, std::is_unsigned_v<T>, v);
                } else if constexpr (std::is_same_v<T, int16_t> || std::is_same_v<T, uint16_t>) {
                    storeFixed(bind, storage, MYSQL_TYPE_SHORT, std::is_unsigned_v<T>, v);
                } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, uint32_t>) {
                    storeFixed(bind, storage, MYSQL_TYPE_LONG, std::is_unsigned_v<T>, v);
                } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
                    storeFixed(bind, storage, MYSQL_TYPE_LONGLONG, std::is_unsigned_v<T>, v);
                } else if constexpr (std::is_same_v<T, float>) {
                    storeFixed(bind, storage, MYSQL_TYPE_FLOAT, false, v);
                } else if constexpr (std::is_same_v<T, double>) {
                    storeFixed(bind, storage, MYSQL_TYPE_DOUBLE, false, v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    storeBytes(bind, storage, length, MYSQL_TYPE_STRING, reinterpret_cast<const unsigned char*>(v.data()), v.size());
                } else if constexpr (std::is_same_v<T, std::vector<unsigned char>>) {
                    storeBytes(bind, storage, length, MYSQL_TYPE_BLOB, v.data(), v.size());
                } else if constexpr (std::is_same_v<T, SqlValue::ChronoDate>) {
                    if (!v.ok()) {
                        return Error(ErrorCode::InvalidArgument, "cannot bind an invalid calendar date");
                    }
                    storeFixed(bind, storage, MYSQL_TYPE_DATE, false, dateToMySqlTime(v));
                } else if constexpr (std::is_same_v<T, SqlValue::ChronoTime>) {
                    storeFixed(bind, storage, MYSQL_TYPE_TIME, false, timeToMySqlTime(v));
                } else if constexpr (std::is_same_v<T, SqlValue::ChronoDateTime>) {
                    storeFixed(bind, storage, MYSQL_TYPE_DATETIME, false, dateTimeToMySqlTime(v));
                } else {
                    static_assert(!sizeof(T), "unhandled SqlValue alternative");
                }
                return rowbind::make_ok();
            },
            value.storage());
    }

    void MySqlParamBuffers::reset(std::size_t count) {
        m_binds.assign(count, MYSQL_BIND{});
        m_data.assign(count, std::vector<unsigned char>());
        m_lengths.assign(count, 0UL);
    }

    Error MySqlParamBuffers::bind(std::size_t index, const SqlValue& value) {
        if (index >= m_binds.size()) {
            return Error(ErrorCode::InvalidArgument, "Bind position " + std::to_string(index) + " out of range (" + std::to_string(m_binds.size()) + " parameters).");
        }
        Error err = encodeParamValue(value, m_binds[index], m_data[index], &m_lengths[index]);
        if (err) {
            err.atColumn(index);
        }
        return err;
    }

}  // namespace rowbind_mysql
