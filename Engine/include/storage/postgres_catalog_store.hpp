#pragma once

#include <storage/catalog_store.hpp>
#include <database/postgres_connection.hpp>
#include <mutex>

namespace Instasave {

/**
 * @brief CatalogStore on PostgreSQL.
 *
 * Owns no connection; a single connection is shared and every call is
 * serialized on an internal mutex.
 */
class PostgresCatalogStore : public CatalogStore {
public:
    explicit PostgresCatalogStore(PostgresConnection& db);

    /**
     * @brief Create tables and indexes if they do not exist yet
     */
    void ensure_schema();

    std::optional<FingerprintRecord> find_fingerprint(const std::string& media_id) override;
    int64_t apply(const PostReconciliation& reconciliation) override;
    std::optional<StoredPost> find_post(const std::string& url) override;

private:
    int64_t upsert_post(const PostReconciliation& rec);
    int64_t ensure_tag(const std::string& name);

    PostgresConnection& db_;
    std::mutex mutex_;
};

} // namespace Instasave
