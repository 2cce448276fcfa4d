#pragma once

/// @file src/storage/sqlite_statement.hpp
/// @brief RAII wrappers over the SQLite C API (internal to src/storage).
///
/// Connection owns a `sqlite3*` and closes it on destruction; Statement
/// owns a prepared `sqlite3_stmt*` and finalizes it. Neither throws: callers
/// check `ok()` / return codes and read the message via `errmsg()`.

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace adsim::storage::detail {

struct ConnectionCloser {
    void operator()(sqlite3* db) const noexcept {
        if (db != nullptr) sqlite3_close(db);
    }
};

using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;

[[nodiscard]] inline std::string errmsg(sqlite3* db) {
    const char* msg = db != nullptr ? sqlite3_errmsg(db) : nullptr;
    return msg != nullptr ? std::string(msg) : std::string("unknown sqlite error");
}

class Statement {
public:
    Statement(sqlite3* db, std::string_view sql) noexcept {
        rc_ = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    }

    ~Statement() {
        if (stmt_ != nullptr) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] bool ok() const noexcept { return rc_ == SQLITE_OK && stmt_ != nullptr; }

    /// SQLITE_ROW, SQLITE_DONE, or an error code.
    [[nodiscard]] int step() noexcept { return sqlite3_step(stmt_); }

    void reset() noexcept {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    // ── Binding (1-based) ─────────────────────────────────────────────────────

    [[nodiscard]] bool bind(int idx, std::int64_t v) noexcept {
        return sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v)) == SQLITE_OK;
    }

    [[nodiscard]] bool bind(int idx, double v) noexcept {
        return sqlite3_bind_double(stmt_, idx, v) == SQLITE_OK;
    }

    [[nodiscard]] bool bind(int idx, std::string_view v) noexcept {
        return sqlite3_bind_text(stmt_, idx, v.data(), static_cast<int>(v.size()),
                                 SQLITE_TRANSIENT) == SQLITE_OK;
    }

    // ── Columns (0-based) ─────────────────────────────────────────────────────

    [[nodiscard]] std::int64_t column_int64(int col) const noexcept {
        return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, col));
    }

    [[nodiscard]] double column_double(int col) const noexcept {
        return sqlite3_column_double(stmt_, col);
    }

    [[nodiscard]] std::string column_text(int col) const {
        const auto* text = sqlite3_column_text(stmt_, col);
        if (text == nullptr) return {};
        const int len = sqlite3_column_bytes(stmt_, col);
        return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(len));
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int           rc_   = SQLITE_ERROR;
};

} // namespace adsim::storage::detail
