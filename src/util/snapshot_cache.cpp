#include <knit/snapshot_cache.hpp>
#include <knit/codec.hpp>
#include <sqlite3.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>

namespace fs = std::filesystem;

namespace knit {

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

static const std::string SCHEMA_VERSION = "1";

struct SnapshotCache::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_store = nullptr;
    sqlite3_stmt* stmt_remove = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_lookup);
        fin(stmt_store);
        fin(stmt_remove);
    }

    Status require_open() const {
        if (!db) return KnitError(KnitError::IO, "snapshot cache is not open");
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        KNIT_TRY(require_open());
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return KnitError(KnitError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        KNIT_TRY(require_open());
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return KnitError(KnitError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status write_schema_version() {
        std::string sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return exec(sql.c_str());
    }

    Status init_schema() {
        KNIT_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS snapshot ("
            "  root TEXT PRIMARY KEY,"
            "  fingerprint TEXT,"
            "  graph_json TEXT,"
            "  created_at INTEGER"
            ");"
        ));

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return KnitError(KnitError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        rc = sqlite3_step(stmt);
        std::string stored;
        if (rc == SQLITE_ROW) {
            const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (ver) stored = ver;
        }
        sqlite3_finalize(stmt);

        if (stored.empty()) {
            return write_schema_version();
        }
        if (stored != SCHEMA_VERSION) {
            // Snapshots written by another schema are unusable
            KNIT_TRY(exec("DELETE FROM snapshot;"));
            return write_schema_version();
        }
        return ok_status();
    }
};

// ---------------------------------------------------------------------------
// SnapshotCache public interface
// ---------------------------------------------------------------------------

SnapshotCache::SnapshotCache() : impl_(std::make_unique<Impl>()) {}
SnapshotCache::~SnapshotCache() = default;
SnapshotCache::SnapshotCache(SnapshotCache&&) noexcept = default;
SnapshotCache& SnapshotCache::operator=(SnapshotCache&&) noexcept = default;

std::string SnapshotCache::default_cache_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.knit/cache/snapshots.db";
}

Status SnapshotCache::open(const std::string& db_path) {
    close();

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return KnitError(KnitError::IO,
                "failed to create cache directory: " + parent.string());
        }
    }

    auto connect = [&]() -> Status {
        int rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            std::string msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return KnitError(KnitError::IO,
                "failed to open snapshot cache " + db_path + ": " + msg);
        }
        KNIT_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        return impl_->init_schema();
    };

    auto first = connect();
    if (first.is_ok()) return first;

    // Corrupt or foreign file: delete and retry once
    close();
    std::error_code ec;
    fs::remove(db_path, ec);
    fs::remove(db_path + "-wal", ec);
    fs::remove(db_path + "-shm", ec);
    auto second = connect();
    if (second.is_err()) close();
    return second;
}

void SnapshotCache::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool SnapshotCache::is_open() const {
    return impl_->db != nullptr;
}

// ---------------------------------------------------------------------------
// Fingerprint
// ---------------------------------------------------------------------------

namespace {

struct Fnv1a {
    uint64_t state = 14695981039346656037ull;

    void update(const std::string& s) {
        for (unsigned char c : s) {
            state ^= c;
            state *= 1099511628211ull;
        }
        // Field separator so "ab"+"c" differs from "a"+"bc"
        state ^= 0xff;
        state *= 1099511628211ull;
    }

    std::string hex() const {
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx",
                      static_cast<unsigned long long>(state));
        return buf;
    }
};

} // namespace

Result<std::string> SnapshotCache::fingerprint(const std::vector<fs::path>& manifests) {
    Fnv1a h;
    h.update(std::to_string(manifests.size()));

    for (const auto& m : manifests) {
        std::error_code ec;
        auto size = fs::file_size(m, ec);
        if (ec) {
            return KnitError(KnitError::IO,
                "cannot stat manifest " + m.string() + ": " + ec.message());
        }
        auto mtime = fs::last_write_time(m, ec);
        if (ec) {
            return KnitError(KnitError::IO,
                "cannot stat manifest " + m.string() + ": " + ec.message());
        }

        h.update(m.generic_string());
        h.update(std::to_string(size));
        h.update(std::to_string(mtime.time_since_epoch().count()));
    }
    return Result<std::string>::ok(h.hex());
}

// ---------------------------------------------------------------------------
// Entries
// ---------------------------------------------------------------------------

Result<SnapshotEntry> SnapshotCache::lookup_entry(const std::string& root) {
    KNIT_TRY(impl_->prepare(
        "SELECT root, fingerprint, graph_json, created_at FROM snapshot WHERE root=?",
        impl_->stmt_lookup));

    sqlite3_stmt* stmt = impl_->stmt_lookup;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, root.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        auto text = [&](int col) {
            const char* s = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return std::string(s ? s : "");
        };
        SnapshotEntry e;
        e.root = text(0);
        e.fingerprint = text(1);
        e.graph_json = text(2);
        e.created_at = sqlite3_column_int64(stmt, 3);
        sqlite3_reset(stmt);
        return Result<SnapshotEntry>::ok(std::move(e));
    }
    sqlite3_reset(stmt);

    if (rc != SQLITE_DONE) {
        return KnitError(KnitError::IO,
            std::string("SQLite lookup failed: ") + sqlite3_errmsg(impl_->db));
    }
    return KnitError(KnitError::NotFound, "no snapshot for: " + root);
}

Result<DependencyGraph> SnapshotCache::lookup(const std::string& root,
                                              const std::string& fingerprint) {
    auto entry = lookup_entry(root);
    if (entry.is_err()) return std::move(entry).error();

    if (entry.value().fingerprint != fingerprint) {
        return KnitError(KnitError::NotFound, "stale snapshot for: " + root);
    }

    auto data = parse_snapshot(entry.value().graph_json);
    if (data.is_err()) return std::move(data).error();
    return Result<DependencyGraph>::ok(deserialize(data.value()));
}

Status SnapshotCache::store(const std::string& root, const std::string& fingerprint,
                            const DependencyGraph& graph) {
    KNIT_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO snapshot (root, fingerprint, graph_json, created_at) "
        "VALUES (?, ?, ?, ?)",
        impl_->stmt_store));

    auto payload = dump_snapshot(serialize(graph), -1);
    if (payload.is_err()) return std::move(payload).error();
    int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    sqlite3_stmt* stmt = impl_->stmt_store;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, root.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, fingerprint.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, payload.value().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, now);

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return KnitError(KnitError::IO,
            std::string("failed to store snapshot: ") + sqlite3_errmsg(impl_->db));
    }
    return ok_status();
}

Status SnapshotCache::remove(const std::string& root) {
    KNIT_TRY(impl_->prepare("DELETE FROM snapshot WHERE root=?", impl_->stmt_remove));

    sqlite3_stmt* stmt = impl_->stmt_remove;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, root.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return KnitError(KnitError::IO,
            std::string("failed to remove snapshot: ") + sqlite3_errmsg(impl_->db));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------------------

Status SnapshotCache::clear() {
    return impl_->exec("DELETE FROM snapshot;");
}

Result<int64_t> SnapshotCache::entry_count() {
    KNIT_TRY(impl_->require_open());

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db, "SELECT COUNT(*) FROM snapshot", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return KnitError(KnitError::IO, "failed to count snapshots");
    }
    int64_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return Result<int64_t>::ok(count);
}

} // namespace knit
