#pragma once

#include "routeweave/routing/routing.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace routeweave::storage {

using routing::AddrInfo;
using routing::Bytes;
using routing::ContentId;
using routing::ContextPtr;
using routing::ResultStreamPtr;
using routing::RoutingOptions;
using routing::RoutingResult;

// Routing backend persisting provider records, the peer address book and
// key/value records in a SQLite database. Call initialize() before use.
class SqliteRouter : public routing::Routing, public routing::ProvideManyRouter {
public:
    SqliteRouter(const std::filesystem::path& db_path, AddrInfo self);
    ~SqliteRouter() override;
    
    SqliteRouter(const SqliteRouter&) = delete;
    SqliteRouter& operator=(const SqliteRouter&) = delete;
    
    bool initialize();
    
    RoutingResult provide(const ContextPtr& ctx, const ContentId& cid, bool announce) override;
    ResultStreamPtr<AddrInfo> find_providers_async(const ContextPtr& ctx, const ContentId& cid,
                                                   int count) override;
    RoutingResult find_peer(const ContextPtr& ctx, const std::string& peer_id, AddrInfo& out) override;
    RoutingResult put_value(const ContextPtr& ctx, const std::string& key, const Bytes& value,
                            const RoutingOptions& options) override;
    RoutingResult get_value(const ContextPtr& ctx, const std::string& key,
                            const RoutingOptions& options, Bytes& out) override;
    RoutingResult search_value(const ContextPtr& ctx, const std::string& key,
                               const RoutingOptions& options, ResultStreamPtr<Bytes>& out) override;
    RoutingResult bootstrap(const ContextPtr& ctx) override;
    
    // All keys are written in one transaction.
    RoutingResult provide_many(const ContextPtr& ctx, const std::vector<ContentId>& keys) override;
    bool ready() const override;
    
    RoutingResult add_peer(const AddrInfo& peer);
    std::size_t record_count();

private:
    bool create_tables();
    RoutingResult storage_error(const std::string& what) const;
    RoutingResult insert_provider(const ContentId& cid, const AddrInfo& provider);
    RoutingResult upsert_peer(const AddrInfo& peer);
    
    std::filesystem::path db_path_;
    const AddrInfo self_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;
};

}
