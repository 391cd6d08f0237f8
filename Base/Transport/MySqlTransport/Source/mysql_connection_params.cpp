#include "rowbind_mysql/mysql_connection_params.h"

#include <algorithm>  // For std::transform
#include <cctype>     // For std::tolower, std::isxdigit
#include <charconv>   // For std::from_chars

namespace rowbind_mysql {

    namespace {

        rowbind::Error invalidUri(const std::string& uri_string, const std::string& reason) {
            return rowbind::Error(rowbind::ErrorCode::InvalidArgument, "Invalid MySQL URI '" + uri_string + "': " + reason);
        }

        // %XY 解码; 非法的转义按字面保留
        std::string url_decode_component(const std::string& encoded) {
            std::string decoded;
            decoded.reserve(encoded.length());
            for (size_t i = 0; i < encoded.length(); ++i) {
                if (encoded[i] == '%' && i + 2 < encoded.length() && std::isxdigit(static_cast<unsigned char>(encoded[i + 1])) && std::isxdigit(static_cast<unsigned char>(encoded[i + 2]))) {
                    unsigned int byte_val = 0;
                    std::from_chars(encoded.data() + i + 1, encoded.data() + i + 3, byte_val, 16);
                    decoded += static_cast<char>(byte_val);
                    i += 2;
                } else {
                    decoded += encoded[i];
                }
            }
            return decoded;
        }

        bool parse_unsigned(const std::string& str, unsigned long max_value, unsigned long& out) {
            if (str.empty()) return false;
            unsigned long value = 0;
            auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
            if (ec != std::errc() || ptr != str.data() + str.size() || value > max_value) return false;
            out = value;
            return true;
        }

    }  // namespace

    std::expected<MySqlConnectionParams, rowbind::Error> MySqlConnectionParams::fromUri(const std::string& uri_string) {
        MySqlConnectionParams params;

        if (uri_string.empty()) {
            return std::unexpected(invalidUri(uri_string, "empty string"));
        }

        // 1. Scheme
        size_t scheme_end_pos = uri_string.find("://");
        if (scheme_end_pos == std::string::npos || scheme_end_pos == 0) {
            return std::unexpected(invalidUri(uri_string, "missing scheme"));
        }
        std::string scheme = uri_string.substr(0, scheme_end_pos);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
            return std::tolower(c);
        });
        if (scheme != "mysql") {
            return std::unexpected(invalidUri(uri_string, "unsupported scheme '" + scheme + "'"));
        }

        std::string remaining = uri_string.substr(scheme_end_pos + 3);

        // 2. Authority
        size_t authority_end_pos = remaining.find_first_of("/?");
        std::string authority = remaining.substr(0, authority_end_pos);
        std::string path_and_query;
        if (authority_end_pos != std::string::npos) {
            path_and_query = remaining.substr(authority_end_pos);
        }

        size_t userinfo_end_pos = authority.rfind('@');
        std::string host_port = authority;
        if (userinfo_end_pos != std::string::npos) {
            std::string userinfo = authority.substr(0, userinfo_end_pos);
            host_port = authority.substr(userinfo_end_pos + 1);
            size_t password_delim_pos = userinfo.find(':');
            if (password_delim_pos != std::string::npos) {
                params.user = url_decode_component(userinfo.substr(0, password_delim_pos));
                params.password = url_decode_component(userinfo.substr(password_delim_pos + 1));
            } else {
                params.user = url_decode_component(userinfo);
            }
        }

        if (!host_port.empty()) {
            size_t port_sep_pos = host_port.rfind(':');
            size_t ipv6_bracket_end_pos = host_port.rfind(']');
            std::string host_str = host_port;
            if (port_sep_pos != std::string::npos && (ipv6_bracket_end_pos == std::string::npos || port_sep_pos > ipv6_bracket_end_pos)) {
                host_str = host_port.substr(0, port_sep_pos);
                unsigned long port_val = 0;
                if (!parse_unsigned(host_port.substr(port_sep_pos + 1), 65535, port_val) || port_val == 0) {
                    return std::unexpected(invalidUri(uri_string, "invalid port"));
                }
                params.port = static_cast<unsigned int>(port_val);
            }
            if (host_str.length() >= 2 && host_str.front() == '[' && host_str.back() == ']') {
                host_str = host_str.substr(1, host_str.length() - 2);
            }
            if (host_str.empty()) {
                return std::unexpected(invalidUri(uri_string, "empty host"));
            }
            params.host = host_str;
        }

        // 3. Database name and query parameters
        std::string path = path_and_query;
        std::string query;
        size_t query_start_pos = path_and_query.find('?');
        if (query_start_pos != std::string::npos) {
            path = path_and_query.substr(0, query_start_pos);
            query = path_and_query.substr(query_start_pos + 1);
        }
        if (!path.empty()) {
            params.db_name = url_decode_component(path.substr(1));
            if (params.db_name.find('/') != std::string::npos) {
                return std::unexpected(invalidUri(uri_string, "database name must not contain '/'"));
            }
        }

        size_t current_pos = 0;
        while (current_pos < query.length()) {
            size_t next_amp_pos = query.find('&', current_pos);
            std::string pair = query.substr(current_pos, next_amp_pos - current_pos);
            if (!pair.empty()) {
                size_t eq_pos = pair.find('=');
                std::string key = url_decode_component(pair.substr(0, eq_pos));
                std::string value = eq_pos == std::string::npos ? std::string() : url_decode_component(pair.substr(eq_pos + 1));

                if (key == "connect_timeout" || key == "read_timeout" || key == "write_timeout") {
                    unsigned long seconds = 0;
                    if (!parse_unsigned(value, 0xFFFFFFFFUL, seconds)) {
                        return std::unexpected(invalidUri(uri_string, "invalid value for " + key));
                    }
                    if (key == "connect_timeout") {
                        params.connect_timeout_seconds = static_cast<unsigned int>(seconds);
                    } else if (key == "read_timeout") {
                        params.read_timeout_seconds = static_cast<unsigned int>(seconds);
                    } else {
                        params.write_timeout_seconds = static_cast<unsigned int>(seconds);
                    }
                } else if (key == "charset") {
                    if (value.empty()) {
                        return std::unexpected(invalidUri(uri_string, "empty charset"));
                    }
                    params.charset = value;
                } else if (key == "unix_socket") {
                    params.unix_socket = value;
                } else {
                    return std::unexpected(invalidUri(uri_string, "unknown parameter '" + key + "'"));
                }
            }
            if (next_amp_pos == std::string::npos) break;
            current_pos = next_amp_pos + 1;
        }

        return params;
    }

}  // namespace rowbind_mysql
