#pragma once

#include <sqlite_orm/sqlite_orm.h>
#include <string>
#include <cstdint>
#include <stdexcept>
#include <chrono>

namespace rosgate {
namespace db {

class DatabaseException : public std::runtime_error {
public:
    explicit DatabaseException(const std::string& msg) : std::runtime_error(msg) {}
};

// Saved router connection; a single row with id 1
struct RouterConnection {
    int64_t id;
    std::string host;
    std::string username;
    std::string password;
    int port;
    int secure;        // 0 or 1
    int rest_port;
    int64_t updated_at;

    RouterConnection() : id(0), port(0), secure(0), rest_port(0), updated_at(0) {}
};

inline auto initStorage(const std::string& path) {
    using namespace sqlite_orm;

    return make_storage(
        path,
        make_table(
            "router_connection",
            make_column("id", &RouterConnection::id, primary_key()),
            make_column("host", &RouterConnection::host),
            make_column("username", &RouterConnection::username),
            make_column("password", &RouterConnection::password),
            make_column("port", &RouterConnection::port, default_value(0)),
            make_column("secure", &RouterConnection::secure, default_value(0)),
            make_column("rest_port", &RouterConnection::rest_port, default_value(0)),
            make_column("updated_at", &RouterConnection::updated_at)
        )
    );
}

using Storage = decltype(initStorage(""));

inline int64_t getCurrentTimestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace db
} // namespace rosgate
