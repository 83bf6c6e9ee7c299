#include "routeweave/storage/sqlite_router.hpp"
#include "routeweave/core/logger.hpp"
#include "routeweave/core/utils.hpp"
#include <sqlite3.h>
#include <algorithm>

namespace routeweave::storage {

using routing::RoutingError;
using routing::ResultStream;
using core::utils::StringUtils;
using core::utils::TimeUtils;

namespace {
    std::string join_addresses(const std::vector<std::string>& addresses) {
        return StringUtils::join(addresses, ",");
    }

    std::vector<std::string> split_addresses(const char* text) {
        std::vector<std::string> addresses;
        if (!text) {
            return addresses;
        }
        for (auto& address : StringUtils::split(text, ',')) {
            if (!address.empty()) {
                addresses.push_back(std::move(address));
            }
        }
        return addresses;
    }

    std::string column_text(sqlite3_stmt* stmt, int column) {
        auto text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char*>(text) : "";
    }
}

SqliteRouter::SqliteRouter(const std::filesystem::path& db_path, AddrInfo self)
    : db_path_(db_path), self_(std::move(self)), db_(nullptr) {
}

SqliteRouter::~SqliteRouter() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteRouter::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (db_) {
        return true;
    }

    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open routing database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("Routing database opened at {}", db_path_.string());
    return true;
}

bool SqliteRouter::create_tables() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS providers (
            cid TEXT NOT NULL,
            peer_id TEXT NOT NULL,
            addresses TEXT,
            announced_at INTEGER NOT NULL,
            PRIMARY KEY (cid, peer_id)
        );
        CREATE TABLE IF NOT EXISTS peers (
            peer_id TEXT PRIMARY KEY,
            addresses TEXT
        );
        CREATE TABLE IF NOT EXISTS records (
            key TEXT PRIMARY KEY,
            value BLOB NOT NULL,
            updated_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_providers_cid ON providers(cid);
    )";

    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, schema, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create routing tables: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }

    return true;
}

RoutingResult SqliteRouter::storage_error(const std::string& what) const {
    std::string detail = db_ ? sqlite3_errmsg(db_) : "database not initialized";
    return RoutingResult(RoutingError::STORAGE_FAILURE, what + ": " + detail);
}

RoutingResult SqliteRouter::insert_provider(const ContentId& cid, const AddrInfo& provider) {
    const char* sql = R"(
        INSERT OR REPLACE INTO providers (cid, peer_id, addresses, announced_at)
        VALUES (?, ?, ?, ?);
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storage_error("prepare provider insert");
    }

    auto cid_hex = cid.to_hex();
    auto addresses = join_addresses(provider.addresses);

    sqlite3_bind_text(stmt, 1, cid_hex.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, provider.peer_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, addresses.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, TimeUtils::unix_millis(std::chrono::system_clock::now()));

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        return storage_error("insert provider");
    }
    return RoutingResult();
}

RoutingResult SqliteRouter::upsert_peer(const AddrInfo& peer) {
    const char* sql = "INSERT OR REPLACE INTO peers (peer_id, addresses) VALUES (?, ?);";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storage_error("prepare peer upsert");
    }

    auto addresses = join_addresses(peer.addresses);
    sqlite3_bind_text(stmt, 1, peer.peer_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, addresses.c_str(), -1, SQLITE_TRANSIENT);

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        return storage_error("upsert peer");
    }
    return RoutingResult();
}

RoutingResult SqliteRouter::provide(const ContextPtr& ctx, const ContentId& cid, bool announce) {
    if (ctx->done()) {
        return ctx->err();
    }
    if (!cid.defined()) {
        return RoutingResult(RoutingError::INVALID_ARGUMENT, "cannot provide an undefined content id");
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return storage_error("provide");
    }

    auto result = insert_provider(cid, self_);
    if (result) {
        LOG_DEBUG("Stored provider record for {} (announce: {})", cid.to_hex(), announce);
    }
    return result;
}

ResultStreamPtr<AddrInfo> SqliteRouter::find_providers_async(const ContextPtr& ctx, const ContentId& cid,
                                                             int count) {
    std::vector<AddrInfo> found;

    if (!ctx->done()) {
        std::lock_guard<std::mutex> lock(db_mutex_);

        sqlite3_stmt* stmt = nullptr;
        const char* sql = "SELECT peer_id, addresses FROM providers WHERE cid = ? ORDER BY announced_at DESC LIMIT ?;";
        if (db_ && sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
            auto cid_hex = cid.to_hex();
            sqlite3_bind_text(stmt, 1, cid_hex.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 2, count > 0 ? count : -1);

            while (sqlite3_step(stmt) == SQLITE_ROW) {
                AddrInfo provider;
                provider.peer_id = column_text(stmt, 0);
                provider.addresses = split_addresses(
                    reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
                found.push_back(std::move(provider));
            }
            sqlite3_finalize(stmt);
        } else {
            LOG_WARN("{}", storage_error("find providers").to_string());
        }
    }

    auto out = ResultStream<AddrInfo>::create(std::max<std::size_t>(found.size(), 1));
    for (auto& provider : found) {
        out->send(std::move(provider));
    }
    out->close();
    return out;
}

RoutingResult SqliteRouter::find_peer(const ContextPtr& ctx, const std::string& peer_id, AddrInfo& out) {
    if (ctx->done()) {
        return ctx->err();
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return storage_error("find peer");
    }

    sqlite3_stmt* stmt;
    const char* sql = "SELECT addresses FROM peers WHERE peer_id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storage_error("prepare peer lookup");
    }

    sqlite3_bind_text(stmt, 1, peer_id.c_str(), -1, SQLITE_TRANSIENT);

    int result = sqlite3_step(stmt);
    if (result == SQLITE_ROW) {
        out.peer_id = peer_id;
        out.addresses = split_addresses(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }
    sqlite3_finalize(stmt);

    if (result == SQLITE_ROW) {
        return RoutingResult();
    }
    if (result == SQLITE_DONE) {
        return RoutingResult::not_found();
    }
    return storage_error("peer lookup");
}

RoutingResult SqliteRouter::put_value(const ContextPtr& ctx, const std::string& key, const Bytes& value,
                                      const RoutingOptions&) {
    if (ctx->done()) {
        return ctx->err();
    }
    if (key.empty()) {
        return RoutingResult(RoutingError::INVALID_ARGUMENT, "empty key");
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return storage_error("put value");
    }

    const char* sql = R"(
        INSERT OR REPLACE INTO records (key, value, updated_at)
        VALUES (?, ?, ?);
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storage_error("prepare record insert");
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (value.empty()) {
        sqlite3_bind_zeroblob(stmt, 2, 0);
    } else {
        sqlite3_bind_blob(stmt, 2, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt, 3, TimeUtils::unix_millis(std::chrono::system_clock::now()));

    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (result != SQLITE_DONE) {
        return storage_error("insert record");
    }
    return RoutingResult();
}

RoutingResult SqliteRouter::get_value(const ContextPtr& ctx, const std::string& key,
                                      const RoutingOptions&, Bytes& out) {
    if (ctx->done()) {
        return ctx->err();
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return storage_error("get value");
    }

    sqlite3_stmt* stmt;
    const char* sql = "SELECT value FROM records WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return storage_error("prepare record lookup");
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int result = sqlite3_step(stmt);
    if (result == SQLITE_ROW) {
        auto data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, 0));
        auto size = sqlite3_column_bytes(stmt, 0);
        out.clear();
        if (size > 0) {
            out.assign(data, data + size);
        }
    }
    sqlite3_finalize(stmt);

    if (result == SQLITE_ROW) {
        return RoutingResult();
    }
    if (result == SQLITE_DONE) {
        return RoutingResult::not_found();
    }
    return storage_error("record lookup");
}

RoutingResult SqliteRouter::search_value(const ContextPtr& ctx, const std::string& key,
                                         const RoutingOptions& options, ResultStreamPtr<Bytes>& out) {
    Bytes value;
    auto result = get_value(ctx, key, options, value);
    if (!result) {
        return result;
    }

    out = ResultStream<Bytes>::create(1);
    out->send(std::move(value));
    out->close();
    return RoutingResult();
}

RoutingResult SqliteRouter::bootstrap(const ContextPtr& ctx) {
    if (ctx->done()) {
        return ctx->err();
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return storage_error("bootstrap");
    }
    if (!self_.empty()) {
        return upsert_peer(self_);
    }
    return RoutingResult();
}

RoutingResult SqliteRouter::provide_many(const ContextPtr& ctx, const std::vector<ContentId>& keys) {
    if (ctx->done()) {
        return ctx->err();
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return storage_error("provide many");
    }

    if (sqlite3_exec(db_, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return storage_error("begin batch provide");
    }

    for (const auto& cid : keys) {
        if (!cid.defined()) {
            continue;
        }
        auto result = insert_provider(cid, self_);
        if (!result) {
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            return result;
        }
    }

    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        auto result = storage_error("commit batch provide");
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        return result;
    }

    LOG_DEBUG("Stored {} provider records in batch", keys.size());
    return RoutingResult();
}

bool SqliteRouter::ready() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_ != nullptr;
}

RoutingResult SqliteRouter::add_peer(const AddrInfo& peer) {
    if (peer.empty()) {
        return RoutingResult(RoutingError::INVALID_ARGUMENT, "peer without id");
    }

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return storage_error("add peer");
    }
    return upsert_peer(peer);
}

std::size_t SqliteRouter::record_count() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM records;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    std::size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

}
