#include <guid/sqlite.hpp>
#include <string>

namespace guid {

static GuidError bind_error(sqlite3_stmt* stmt, int rc) {
    sqlite3* db = sqlite3_db_handle(stmt);
    return GuidError(GuidError::Storage,
        std::string("SQLite bind failed: ") + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
}

Status bind_guid(sqlite3_stmt* stmt, int index, const Guid& g) {
    std::string text = g.to_string();
    int rc = sqlite3_bind_text(stmt, index, text.c_str(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) return bind_error(stmt, rc);
    return ok_status();
}

Status bind_guid_blob(sqlite3_stmt* stmt, int index, const Guid& g) {
    const auto& raw = g.bytes();
    int rc = sqlite3_bind_blob(stmt, index, raw.data(),
                               static_cast<int>(raw.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) return bind_error(stmt, rc);
    return ok_status();
}

Result<Guid> column_guid(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            return Result<Guid>::ok(Guid());
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(
                sqlite3_column_text(stmt, col));
            int len = sqlite3_column_bytes(stmt, col);
            return Guid::parse(std::string(text ? text : "", static_cast<size_t>(len)));
        }
        case SQLITE_BLOB: {
            const uint8_t* blob = static_cast<const uint8_t*>(
                sqlite3_column_blob(stmt, col));
            size_t len = static_cast<size_t>(sqlite3_column_bytes(stmt, col));
            // Text form first: raw bytes always hold a 0x00 pad or a byte
            // >= 0x80, neither of which is a base36 digit.
            if (!blob) len = 0;
            auto text = Guid::parse(len == 0 ? std::string()
                : std::string(reinterpret_cast<const char*>(blob), len));
            if (text.is_ok()) return text;
            return Guid::from_bytes(blob, len);
        }
        default:
            return GuidError(GuidError::Storage,
                "column " + std::to_string(col) + " holds neither TEXT nor BLOB");
    }
}

} // namespace guid
