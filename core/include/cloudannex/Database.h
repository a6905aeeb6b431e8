// Database.h — SQLite-хранилище журнала загрузок

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace CloudAnnex {

/// Исключение базы данных (журнал загрузок)
class DatabaseException : public std::runtime_error {
public:
    explicit DatabaseException(const std::string& message)
        : std::runtime_error(message) {}
};

/// RAII обёртка над SQLite соединением журнала
class Database {
public:
    explicit Database(const std::string& dbPath);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// Применяет недостающие миграции схемы
    void initialize();

    /// SQL без параметров и без результата (PRAGMA, BEGIN/COMMIT, DDL)
    void execute(const std::string& sql);

    template<typename... Args>
    void execute(const std::string& sql, const Args&... args) {
        auto stmt = prepare(sql);
        bindAll(stmt.get(), 1, args...);
        while (stepRow(stmt.get())) {
        }
    }

    template<typename T, typename Mapper, typename... Args>
    std::vector<T> query(const std::string& sql, Mapper mapper, const Args&... args) {
        auto stmt = prepare(sql);
        bindAll(stmt.get(), 1, args...);
        std::vector<T> rows;
        while (stepRow(stmt.get())) {
            rows.push_back(mapper(stmt.get()));
        }
        return rows;
    }

    template<typename T, typename Mapper, typename... Args>
    std::optional<T> queryOne(const std::string& sql, Mapper mapper, const Args&... args) {
        auto stmt = prepare(sql);
        bindAll(stmt.get(), 1, args...);
        if (!stepRow(stmt.get())) {
            return std::nullopt;
        }
        return mapper(stmt.get());
    }

    /// Строк затронуто последним INSERT/UPDATE/DELETE
    int changesCount() const;

    static int64_t getInt64(sqlite3_stmt* stmt, int col);
    static std::string getString(sqlite3_stmt* stmt, int col);

    const std::string& path() const { return m_dbPath; }

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    sqlite3* m_db = nullptr;
    std::string m_dbPath;

    void applyMigrations();
    int64_t currentVersion();

    Statement prepare(const std::string& sql);
    bool stepRow(sqlite3_stmt* stmt);

    void bind(sqlite3_stmt* stmt, int index, int64_t value);
    void bind(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind(sqlite3_stmt* stmt, int index, const char* value);

    void bindAll(sqlite3_stmt*, int) {}

    template<typename T, typename... Rest>
    void bindAll(sqlite3_stmt* stmt, int index, const T& first, const Rest&... rest) {
        bind(stmt, index, first);
        bindAll(stmt, index + 1, rest...);
    }
};

} // namespace CloudAnnex
