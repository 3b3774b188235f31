#include <catch2/catch.hpp>
#include <guid/json.hpp>
#include <guid/sqlite.hpp>
#include <map>
#include <stdexcept>
#include <vector>

using namespace guid;

static Guid sample() {
    auto r = Guid::parse("xokp8l85n201pq00dw00rs6rgq");
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== JSON =====

TEST_CASE("json: guid serializes as its text form", "[json]") {
    nlohmann::json j = sample();
    REQUIRE(j.is_string());
    REQUIRE(j.get<std::string>() == "xokp8l85n201pq00dw00rs6rgq");
    REQUIRE(j.dump() == "\"xokp8l85n201pq00dw00rs6rgq\"");
}

TEST_CASE("json: guid reads back inside containers", "[json]") {
    std::map<std::string, Guid> in{{"owner", sample()}, {"zero", Guid().with_prefix_bytes('0', '0')}};
    nlohmann::json j = in;
    auto out = nlohmann::json::parse(j.dump()).get<std::map<std::string, Guid>>();
    REQUIRE(out == in);
}

TEST_CASE("json: bad values throw from get", "[json]") {
    REQUIRE_THROWS_AS(nlohmann::json(42).get<Guid>(), std::invalid_argument);
    REQUIRE_THROWS_AS(nlohmann::json("too short").get<Guid>(), std::invalid_argument);
}

TEST_CASE("json: guid_from_json reports errors", "[json]") {
    auto not_string = guid_from_json(nlohmann::json::array());
    REQUIRE(not_string.is_err());
    REQUIRE(not_string.error().code == GuidError::Parse);
    REQUIRE(not_string.error().message.find("array") != std::string::npos);

    auto bad_length = guid_from_json("abc");
    REQUIRE(bad_length.is_err());
    REQUIRE(bad_length.error().code == GuidError::InvalidLength);

    auto good = guid_from_json("xokp8l85n201pq00dw00rs6rgq");
    REQUIRE(good.is_ok());
    REQUIRE(good.value() == sample());
}

// ===== SQLite =====

namespace {

// In-memory database with one table; closed on scope exit
struct MemoryDb {
    sqlite3* db = nullptr;

    MemoryDb() {
        REQUIRE(sqlite3_open(":memory:", &db) == SQLITE_OK);
        exec("CREATE TABLE ids (id INTEGER PRIMARY KEY, g)");
    }
    ~MemoryDb() { sqlite3_close(db); }

    void exec(const char* sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        std::string msg = err ? err : "";
        sqlite3_free(err);
        INFO(msg);
        REQUIRE(rc == SQLITE_OK);
    }

    sqlite3_stmt* prepare(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        REQUIRE(sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK);
        return stmt;
    }
};

} // namespace

TEST_CASE("sqlite: text binding round-trips", "[sqlite]") {
    MemoryDb m;
    sqlite3_stmt* ins = m.prepare("INSERT INTO ids (id, g) VALUES (1, ?)");
    REQUIRE(bind_guid(ins, 1, sample()).is_ok());
    REQUIRE(sqlite3_step(ins) == SQLITE_DONE);
    sqlite3_finalize(ins);

    sqlite3_stmt* sel = m.prepare("SELECT g, typeof(g) FROM ids WHERE id = 1");
    REQUIRE(sqlite3_step(sel) == SQLITE_ROW);
    REQUIRE(std::string(reinterpret_cast<const char*>(sqlite3_column_text(sel, 1))) == "text");
    auto r = column_guid(sel, 0);
    sqlite3_finalize(sel);

    REQUIRE(r.is_ok());
    REQUIRE(r.value() == sample());
}

TEST_CASE("sqlite: blob binding round-trips", "[sqlite]") {
    MemoryDb m;
    sqlite3_stmt* ins = m.prepare("INSERT INTO ids (id, g) VALUES (1, ?)");
    REQUIRE(bind_guid_blob(ins, 1, sample()).is_ok());
    REQUIRE(sqlite3_step(ins) == SQLITE_DONE);
    sqlite3_finalize(ins);

    sqlite3_stmt* sel = m.prepare("SELECT g, length(g) FROM ids WHERE id = 1");
    REQUIRE(sqlite3_step(sel) == SQLITE_ROW);
    REQUIRE(sqlite3_column_int(sel, 1) == static_cast<int>(layout::kSize));
    auto r = column_guid(sel, 0);
    sqlite3_finalize(sel);

    REQUIRE(r.is_ok());
    REQUIRE(r.value() == sample());
}

TEST_CASE("sqlite: blob holding the text form is parsed", "[sqlite]") {
    const std::string text = "xokp8l85n201pq00dw00rs6rgq";
    MemoryDb m;
    sqlite3_stmt* ins = m.prepare("INSERT INTO ids (id, g) VALUES (1, ?)");
    REQUIRE(sqlite3_bind_blob(ins, 1, text.data(), static_cast<int>(text.size()),
                              SQLITE_TRANSIENT) == SQLITE_OK);
    REQUIRE(sqlite3_step(ins) == SQLITE_DONE);
    sqlite3_finalize(ins);

    sqlite3_stmt* sel = m.prepare("SELECT g, typeof(g) FROM ids WHERE id = 1");
    REQUIRE(sqlite3_step(sel) == SQLITE_ROW);
    REQUIRE(std::string(reinterpret_cast<const char*>(sqlite3_column_text(sel, 1))) == "blob");
    auto r = column_guid(sel, 0);
    sqlite3_finalize(sel);

    REQUIRE(r.is_ok());
    REQUIRE(r.value() == sample());
    REQUIRE(r.value().to_string() == text);
}

TEST_CASE("sqlite: text column sorts by prefix then timestamp", "[sqlite]") {
    MemoryDb m;
    Guid base = sample();
    std::vector<Guid> guids = {
        base.with_unix_millis(base.unix_millis() + 2000),
        base,
        base.with_unix_millis(base.unix_millis() + 1000),
    };
    sqlite3_stmt* ins = m.prepare("INSERT INTO ids (g) VALUES (?)");
    for (const auto& g : guids) {
        REQUIRE(bind_guid(ins, 1, g).is_ok());
        REQUIRE(sqlite3_step(ins) == SQLITE_DONE);
        sqlite3_reset(ins);
    }
    sqlite3_finalize(ins);

    sqlite3_stmt* sel = m.prepare("SELECT g FROM ids ORDER BY g");
    std::vector<int64_t> millis;
    while (sqlite3_step(sel) == SQLITE_ROW) {
        auto r = column_guid(sel, 0);
        REQUIRE(r.is_ok());
        millis.push_back(r.value().unix_millis());
    }
    sqlite3_finalize(sel);

    REQUIRE(millis == std::vector<int64_t>{
        base.unix_millis(), base.unix_millis() + 1000, base.unix_millis() + 2000});
}

TEST_CASE("sqlite: NULL reads as the zero guid", "[sqlite]") {
    MemoryDb m;
    m.exec("INSERT INTO ids (id, g) VALUES (1, NULL)");
    sqlite3_stmt* sel = m.prepare("SELECT g FROM ids WHERE id = 1");
    REQUIRE(sqlite3_step(sel) == SQLITE_ROW);
    auto r = column_guid(sel, 0);
    sqlite3_finalize(sel);

    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_zero());
}

TEST_CASE("sqlite: unusable columns are errors", "[sqlite]") {
    MemoryDb m;
    m.exec("INSERT INTO ids (id, g) VALUES (1, 12345)");
    m.exec("INSERT INTO ids (id, g) VALUES (2, 'not a guid')");
    m.exec("INSERT INTO ids (id, g) VALUES (3, x'0102')");

    sqlite3_stmt* sel = m.prepare("SELECT g FROM ids ORDER BY id");

    REQUIRE(sqlite3_step(sel) == SQLITE_ROW);
    auto integer = column_guid(sel, 0);
    REQUIRE(integer.is_err());
    REQUIRE(integer.error().code == GuidError::Storage);

    REQUIRE(sqlite3_step(sel) == SQLITE_ROW);
    auto text = column_guid(sel, 0);
    REQUIRE(text.is_err());
    REQUIRE(text.error().code == GuidError::InvalidLength);

    REQUIRE(sqlite3_step(sel) == SQLITE_ROW);
    auto blob = column_guid(sel, 0);
    REQUIRE(blob.is_err());
    REQUIRE(blob.error().code == GuidError::InvalidLength);

    sqlite3_finalize(sel);
}

TEST_CASE("sqlite: binding past the last parameter fails", "[sqlite]") {
    MemoryDb m;
    sqlite3_stmt* ins = m.prepare("INSERT INTO ids (g) VALUES (?)");
    auto st = bind_guid(ins, 2, sample());
    sqlite3_finalize(ins);

    REQUIRE(st.is_err());
    REQUIRE(st.error().code == GuidError::Storage);
}
