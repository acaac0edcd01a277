/**
 * @file sqlite_message_store.cpp
 * @brief SQLite message store implementation
 */

#include "sms/relay/storage/sqlite_message_store.h"

#include "sms/relay/integration/logger_adapter.h"

#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

#include <sqlite3.h>

namespace sms::relay::storage {

namespace {

/**
 * @brief Convert time_point to SQLite timestamp string (UTC, millisecond)
 */
std::string to_sqlite_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch())
                      .count() %
                  1000;
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

/**
 * @brief Parse SQLite timestamp string to time_point
 */
std::chrono::system_clock::time_point from_sqlite_timestamp(const std::string& str) {
    if (str.empty()) {
        return std::chrono::system_clock::time_point{};
    }

    std::tm tm_val{};
    int millis = 0;

    // Parse: "YYYY-MM-DD HH:MM:SS.mmm"
    std::istringstream iss(str);
    iss >> std::get_time(&tm_val, "%Y-%m-%d %H:%M:%S");
    if (iss.peek() == '.') {
        iss.ignore();
        iss >> millis;
    }

    auto time_t_val = timegm(&tm_val);
    return std::chrono::system_clock::from_time_t(time_t_val) +
           std::chrono::milliseconds(millis);
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

/**
 * @brief Finalizes a prepared statement on scope exit
 */
class statement {
public:
    statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }

    ~statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    [[nodiscard]] explicit operator bool() const noexcept { return stmt_ != nullptr; }
    [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

constexpr const char* select_message_sql = R"(
    SELECT m.id, m.text, m.direction, m.status, m.created_at, m.in_response_to,
           c.id, c.backend, c.identity
    FROM messages m JOIN connections c ON c.id = m.connection_id
)";

}  // namespace

// =============================================================================
// Implementation
// =============================================================================

class sqlite_message_store::impl {
public:
    explicit impl(const store_config& config) : config_(config) {}

    ~impl() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::expected<void, store_error> open_database() {
        std::lock_guard lock(db_mutex_);

        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        int rc = sqlite3_open_v2(config_.database_path.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            integration::get_logger().error(
                "[Store] failed to open database path=" + config_.database_path +
                " error=" + (db_ ? sqlite3_errmsg(db_) : "out of memory"));
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return std::unexpected(store_error::database_error);
        }

        if (config_.enable_wal_mode) {
            execute_sql("PRAGMA journal_mode=WAL");
            execute_sql("PRAGMA synchronous=NORMAL");
        }
        execute_sql("PRAGMA foreign_keys=ON");

        sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout.count()));

        auto create_result = create_tables();
        if (!create_result) {
            sqlite3_close(db_);
            db_ = nullptr;
            return create_result;
        }

        return {};
    }

    std::expected<void, store_error> create_tables() {
        const char* connections_table = R"(
            CREATE TABLE IF NOT EXISTS connections (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                backend TEXT NOT NULL,
                identity TEXT NOT NULL,
                UNIQUE(backend, identity)
            )
        )";

        const char* messages_table = R"(
            CREATE TABLE IF NOT EXISTS messages (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                connection_id INTEGER NOT NULL REFERENCES connections(id),
                text TEXT NOT NULL,
                direction TEXT NOT NULL,
                status TEXT NOT NULL,
                created_at TEXT NOT NULL,
                in_response_to INTEGER REFERENCES messages(id)
            )
        )";

        const char* params_table = R"(
            CREATE TABLE IF NOT EXISTS message_params (
                message_id INTEGER NOT NULL REFERENCES messages(id),
                name TEXT NOT NULL,
                value TEXT NOT NULL,
                PRIMARY KEY(message_id, name)
            )
        )";

        const char* indexes[] = {
            "CREATE INDEX IF NOT EXISTS idx_messages_status ON messages(status)",
            "CREATE INDEX IF NOT EXISTS idx_messages_response ON messages(in_response_to)"};

        if (!execute_sql(connections_table) || !execute_sql(messages_table) ||
            !execute_sql(params_table)) {
            return std::unexpected(store_error::database_error);
        }

        for (const auto* idx : indexes) {
            if (!execute_sql(idx)) {
                return std::unexpected(store_error::database_error);
            }
        }

        return {};
    }

    bool execute_sql(const char* sql) {
        char* error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK) {
            integration::get_logger().warning(
                std::string("[Store] statement failed: ") +
                (error_msg ? error_msg : "unknown error"));
            if (error_msg) {
                sqlite3_free(error_msg);
            }
            return false;
        }
        return true;
    }

    std::expected<core::message_record, store_error> create_message(
        const core::new_message& message) {
        if (message.connection.id <= 0) {
            return std::unexpected(store_error::connection_not_found);
        }

        std::lock_guard lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        if (message.in_response_to && !load_message(*message.in_response_to)) {
            return std::unexpected(store_error::message_not_found);
        }

        const char* sql = R"(
            INSERT INTO messages (connection_id, text, direction, status,
                                  created_at, in_response_to)
            VALUES (?, ?, ?, ?, ?, ?)
        )";

        statement stmt(db_, sql);
        if (!stmt) return std::unexpected(store_error::database_error);

        auto now = std::chrono::system_clock::now();
        std::string now_str = to_sqlite_timestamp(now);
        const char direction_code[2] = {core::to_code(message.direction), '\0'};
        const char status_code[2] = {core::to_code(message.status), '\0'};

        if (!execute_sql("BEGIN IMMEDIATE")) {
            return std::unexpected(store_error::database_error);
        }

        sqlite3_bind_int64(stmt.get(), 1, message.connection.id);
        sqlite3_bind_text(stmt.get(), 2, message.text.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, direction_code, -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 4, status_code, -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 5, now_str.c_str(), -1, SQLITE_TRANSIENT);
        if (message.in_response_to) {
            sqlite3_bind_int64(stmt.get(), 6, *message.in_response_to);
        } else {
            sqlite3_bind_null(stmt.get(), 6);
        }

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            integration::get_logger().error(
                std::string("[Store] insert failed: ") + sqlite3_errmsg(db_));
            execute_sql("ROLLBACK");
            return std::unexpected(store_error::database_error);
        }

        const core::message_id id = sqlite3_last_insert_rowid(db_);
        if (!write_params(id, message.params) || !execute_sql("COMMIT")) {
            execute_sql("ROLLBACK");
            return std::unexpected(store_error::database_error);
        }

        auto created = load_message(id);
        if (!created) {
            return std::unexpected(store_error::database_error);
        }
        return std::move(*created);
    }

    std::expected<core::message_record, store_error> update_status(
        core::message_id id, core::message_status status) {
        std::lock_guard lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        auto current = load_message(id);
        if (!current) {
            return std::unexpected(current.error());
        }

        if (!core::can_transition(current->status, status)) {
            return std::unexpected(store_error::invalid_transition);
        }
        if (current->status == status) {
            return std::move(*current);
        }

        statement stmt(db_, "UPDATE messages SET status = ? WHERE id = ?");
        if (!stmt) return std::unexpected(store_error::database_error);

        const char status_code[2] = {core::to_code(status), '\0'};
        sqlite3_bind_text(stmt.get(), 1, status_code, -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 2, id);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            return std::unexpected(store_error::database_error);
        }

        current->status = status;
        return std::move(*current);
    }

    std::expected<core::message_record, store_error> update_payload(
        core::message_id id, const std::string& text, const core::param_map& params) {
        std::lock_guard lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        auto current = load_message(id);
        if (!current) {
            return std::unexpected(current.error());
        }
        if (current->direction != core::message_direction::outbound ||
            current->status != core::message_status::pending) {
            return std::unexpected(store_error::invalid_transition);
        }

        statement stmt(db_, "UPDATE messages SET text = ? WHERE id = ?");
        if (!stmt) return std::unexpected(store_error::database_error);
        sqlite3_bind_text(stmt.get(), 1, text.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt.get(), 2, id);

        if (!execute_sql("BEGIN IMMEDIATE")) {
            return std::unexpected(store_error::database_error);
        }
        if (sqlite3_step(stmt.get()) != SQLITE_DONE || !clear_params(id) ||
            !write_params(id, params) || !execute_sql("COMMIT")) {
            integration::get_logger().error("[Store] msg_id=" + std::to_string(id) +
                                            " payload update failed: " +
                                            sqlite3_errmsg(db_));
            execute_sql("ROLLBACK");
            return std::unexpected(store_error::database_error);
        }

        current->text = text;
        current->params = params;
        return std::move(*current);
    }

    std::expected<core::message_record, store_error> get_message(core::message_id id) {
        std::lock_guard lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);
        return load_message(id);
    }

    std::expected<std::vector<core::message_record>, store_error> find_by_status(
        core::message_status status) {
        std::lock_guard lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        std::string sql = std::string(select_message_sql) +
                          " WHERE m.status = ? ORDER BY m.id ASC";
        statement stmt(db_, sql.c_str());
        if (!stmt) return std::unexpected(store_error::database_error);

        const char status_code[2] = {core::to_code(status), '\0'};
        sqlite3_bind_text(stmt.get(), 1, status_code, -1, SQLITE_TRANSIENT);

        std::vector<core::message_record> result;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            auto record = read_row(stmt.get());
            if (!record) {
                return std::unexpected(record.error());
            }
            if (!read_params(*record)) {
                return std::unexpected(store_error::database_error);
            }
            result.push_back(std::move(*record));
        }
        if (rc != SQLITE_DONE) {
            return std::unexpected(store_error::database_error);
        }
        return result;
    }

    std::expected<core::connection, store_error> get_or_create(
        std::string_view backend, std::string_view identity) {
        if (backend.empty() || identity.empty()) {
            return std::unexpected(store_error::invalid_message);
        }

        std::lock_guard lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        std::string backend_str(backend);
        std::string identity_str(identity);

        {
            statement insert(db_,
                             "INSERT OR IGNORE INTO connections (backend, identity) "
                             "VALUES (?, ?)");
            if (!insert) return std::unexpected(store_error::database_error);
            sqlite3_bind_text(insert.get(), 1, backend_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(insert.get(), 2, identity_str.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(insert.get()) != SQLITE_DONE) {
                return std::unexpected(store_error::database_error);
            }
        }

        statement select(db_,
                         "SELECT id FROM connections WHERE backend = ? AND identity = ?");
        if (!select) return std::unexpected(store_error::database_error);
        sqlite3_bind_text(select.get(), 1, backend_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(select.get(), 2, identity_str.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(select.get()) != SQLITE_ROW) {
            return std::unexpected(store_error::connection_not_found);
        }

        core::connection conn;
        conn.id = sqlite3_column_int64(select.get(), 0);
        conn.backend = std::move(backend_str);
        conn.identity = std::move(identity_str);
        return conn;
    }

    const store_config& config() const noexcept { return config_; }

private:
    /** Caller holds db_mutex_. */
    std::expected<core::message_record, store_error> load_message(core::message_id id) {
        std::string sql = std::string(select_message_sql) + " WHERE m.id = ?";
        statement stmt(db_, sql.c_str());
        if (!stmt) return std::unexpected(store_error::database_error);

        sqlite3_bind_int64(stmt.get(), 1, id);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            return std::unexpected(store_error::message_not_found);
        }
        if (rc != SQLITE_ROW) {
            return std::unexpected(store_error::database_error);
        }

        auto record = read_row(stmt.get());
        if (record && !read_params(*record)) {
            return std::unexpected(store_error::database_error);
        }
        return record;
    }

    /** Caller holds db_mutex_. */
    bool read_params(core::message_record& record) {
        statement stmt(db_,
                       "SELECT name, value FROM message_params WHERE message_id = ?");
        if (!stmt) return false;
        sqlite3_bind_int64(stmt.get(), 1, record.id);

        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            record.params.insert_or_assign(column_string(stmt.get(), 0),
                                           column_string(stmt.get(), 1));
        }
        return rc == SQLITE_DONE;
    }

    /** Caller holds db_mutex_. */
    bool write_params(core::message_id id, const core::param_map& params) {
        if (params.empty()) {
            return true;
        }
        statement stmt(db_,
                       "INSERT INTO message_params (message_id, name, value) "
                       "VALUES (?, ?, ?)");
        if (!stmt) return false;

        for (const auto& [name, value] : params) {
            sqlite3_reset(stmt.get());
            sqlite3_bind_int64(stmt.get(), 1, id);
            sqlite3_bind_text(stmt.get(), 2, name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 3, value.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
                return false;
            }
        }
        return true;
    }

    /** Caller holds db_mutex_. */
    bool clear_params(core::message_id id) {
        statement stmt(db_, "DELETE FROM message_params WHERE message_id = ?");
        if (!stmt) return false;
        sqlite3_bind_int64(stmt.get(), 1, id);
        return sqlite3_step(stmt.get()) == SQLITE_DONE;
    }

    static std::expected<core::message_record, store_error> read_row(sqlite3_stmt* stmt) {
        core::message_record record;
        record.id = sqlite3_column_int64(stmt, 0);
        record.text = column_string(stmt, 1);

        auto direction = column_string(stmt, 2);
        auto status = column_string(stmt, 3);
        auto parsed_direction =
            direction.size() == 1 ? core::direction_from_code(direction[0]) : std::nullopt;
        auto parsed_status =
            status.size() == 1 ? core::status_from_code(status[0]) : std::nullopt;
        if (!parsed_direction || !parsed_status) {
            return std::unexpected(store_error::corrupt_record);
        }
        record.direction = *parsed_direction;
        record.status = *parsed_status;

        record.timestamp = from_sqlite_timestamp(column_string(stmt, 4));
        if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
            record.in_response_to = sqlite3_column_int64(stmt, 5);
        }

        record.connection.id = sqlite3_column_int64(stmt, 6);
        record.connection.backend = column_string(stmt, 7);
        record.connection.identity = column_string(stmt, 8);
        return record;
    }

    store_config config_;
    sqlite3* db_ = nullptr;
    std::mutex db_mutex_;
};

// =============================================================================
// Public Interface
// =============================================================================

std::expected<std::unique_ptr<sqlite_message_store>, store_error>
sqlite_message_store::open(const store_config& config) {
    if (config.database_path.empty()) {
        return std::unexpected(store_error::database_error);
    }

    auto pimpl = std::make_unique<impl>(config);
    auto result = pimpl->open_database();
    if (!result) {
        return std::unexpected(result.error());
    }

    integration::get_logger().info("[Store] opened sqlite database path=" +
                                   config.database_path);
    return std::unique_ptr<sqlite_message_store>(
        new sqlite_message_store(std::move(pimpl)));
}

sqlite_message_store::sqlite_message_store(std::unique_ptr<impl> pimpl)
    : pimpl_(std::move(pimpl)) {}

sqlite_message_store::~sqlite_message_store() = default;

std::expected<core::message_record, store_error>
sqlite_message_store::create_message(const core::new_message& message) {
    return pimpl_->create_message(message);
}

std::expected<core::message_record, store_error>
sqlite_message_store::update_status(core::message_id id, core::message_status status) {
    return pimpl_->update_status(id, status);
}

std::expected<core::message_record, store_error>
sqlite_message_store::update_payload(core::message_id id, const std::string& text,
                                     const core::param_map& params) {
    return pimpl_->update_payload(id, text, params);
}

std::expected<core::message_record, store_error>
sqlite_message_store::get_message(core::message_id id) const {
    return pimpl_->get_message(id);
}

std::expected<std::vector<core::message_record>, store_error>
sqlite_message_store::find_by_status(core::message_status status) const {
    return pimpl_->find_by_status(status);
}

std::expected<core::connection, store_error>
sqlite_message_store::get_or_create(std::string_view backend, std::string_view identity) {
    return pimpl_->get_or_create(backend, identity);
}

const store_config& sqlite_message_store::config() const noexcept {
    return pimpl_->config();
}

}  // namespace sms::relay::storage
