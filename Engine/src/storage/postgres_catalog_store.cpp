/**
 * @file postgres_catalog_store.cpp
 * @brief Posts, tags and media rows in PostgreSQL
 */

#include <storage/postgres_catalog_store.hpp>
#include <utils/logger.hpp>

namespace Instasave {

namespace {

const char* k_schema_sql = R"(
    CREATE TABLE IF NOT EXISTS posts (
        id BIGSERIAL PRIMARY KEY,
        url TEXT UNIQUE NOT NULL,
        caption TEXT,
        "timestamp" BIGINT NOT NULL,
        media_paths JSONB NOT NULL DEFAULT '[]'::jsonb
    );

    CREATE TABLE IF NOT EXISTS tags (
        id BIGSERIAL PRIMARY KEY,
        name TEXT UNIQUE NOT NULL
    );

    CREATE TABLE IF NOT EXISTS post_tags (
        post_id BIGINT NOT NULL REFERENCES posts (id) ON DELETE CASCADE,
        tag_id BIGINT NOT NULL REFERENCES tags (id) ON DELETE CASCADE,
        PRIMARY KEY (post_id, tag_id)
    );

    CREATE TABLE IF NOT EXISTS media_items (
        post_id BIGINT NOT NULL REFERENCES posts (id) ON DELETE CASCADE,
        idx INTEGER NOT NULL,
        media_id TEXT NOT NULL,
        path TEXT NOT NULL,
        fingerprint TEXT NOT NULL,
        byte_length BIGINT NOT NULL,
        PRIMARY KEY (post_id, idx)
    );

    CREATE INDEX IF NOT EXISTS idx_posts_timestamp ON posts ("timestamp");
    CREATE INDEX IF NOT EXISTS idx_media_items_media_id ON media_items (media_id);
)";

} // namespace

PostgresCatalogStore::PostgresCatalogStore(PostgresConnection& db) : db_(db) {}

void PostgresCatalogStore::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        db_.execute(k_schema_sql);
    } catch (const DatabaseError& e) {
        // Two processes racing CREATE ... IF NOT EXISTS collide on the catalog's unique index
        if (!e.is_unique_violation()) throw;
        Logger::warn("schema_create_raced (SQLSTATE " + e.sqlstate() + "); retrying once");
        db_.execute(k_schema_sql);
    }
}

std::optional<FingerprintRecord> PostgresCatalogStore::find_fingerprint(const std::string& media_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<FingerprintRecord> record;
    db_.query(
        "SELECT media_id, path, fingerprint, byte_length FROM media_items "
        "WHERE media_id = $1 ORDER BY post_id DESC, idx LIMIT 1",
        {media_id},
        [&](const std::vector<std::string>& row) {
            FingerprintRecord r;
            r.media_id = row[0];
            r.path = row[1];
            r.fingerprint = row[2];
            r.byte_length = std::stoull(row[3]);
            record = r;
        });
    return record;
}

int64_t PostgresCatalogStore::upsert_post(const PostReconciliation& rec) {
    auto id = db_.query_single(
        "INSERT INTO posts (url, caption, \"timestamp\", media_paths) "
        "VALUES ($1, NULLIF($2, ''), $3, $4::jsonb) "
        "ON CONFLICT (url) DO UPDATE SET caption = EXCLUDED.caption, "
        "\"timestamp\" = EXCLUDED.\"timestamp\", media_paths = EXCLUDED.media_paths "
        "RETURNING id",
        {rec.url, rec.caption, std::to_string(rec.timestamp), rec.media_paths_json});
    if (!id) {
        throw DatabaseError("Post upsert returned no id for " + rec.url);
    }
    return std::stoll(*id);
}

int64_t PostgresCatalogStore::ensure_tag(const std::string& name) {
    auto id = db_.query_single(
        "INSERT INTO tags (name) VALUES ($1) ON CONFLICT (name) DO NOTHING RETURNING id",
        {name});
    if (!id) {
        // Existing row, possibly created by a concurrent inserter
        id = db_.query_single("SELECT id FROM tags WHERE name = $1", {name});
    }
    if (!id) {
        throw DatabaseError("Tag '" + name + "' neither inserted nor found");
    }
    return std::stoll(*id);
}

int64_t PostgresCatalogStore::apply(const PostReconciliation& rec) {
    std::lock_guard<std::mutex> lock(mutex_);

    PostgresConnection::Transaction txn(db_);

    int64_t post_id = upsert_post(rec);
    std::string post_id_str = std::to_string(post_id);

    for (const auto& tag : rec.tags) {
        int64_t tag_id = ensure_tag(tag);
        db_.execute(
            "INSERT INTO post_tags (post_id, tag_id) VALUES ($1, $2) ON CONFLICT DO NOTHING",
            {post_id_str, std::to_string(tag_id)});
    }

    for (const auto& m : rec.media) {
        db_.execute(
            "INSERT INTO media_items (post_id, idx, media_id, path, fingerprint, byte_length) "
            "VALUES ($1, $2, $3, $4, $5, $6) "
            "ON CONFLICT (post_id, idx) DO UPDATE SET media_id = EXCLUDED.media_id, "
            "path = EXCLUDED.path, fingerprint = EXCLUDED.fingerprint, byte_length = EXCLUDED.byte_length",
            {post_id_str, std::to_string(m.index), m.media_id, m.path, m.fingerprint,
             std::to_string(m.byte_length)});
    }

    txn.commit();
    return post_id;
}

std::optional<StoredPost> PostgresCatalogStore::find_post(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<StoredPost> post;
    db_.query(
        "SELECT id, url, COALESCE(caption, ''), \"timestamp\", media_paths::text FROM posts WHERE url = $1",
        {url},
        [&](const std::vector<std::string>& row) {
            StoredPost p;
            p.id = std::stoll(row[0]);
            p.url = row[1];
            p.caption = row[2];
            p.timestamp = std::stoll(row[3]);
            p.media_paths_json = row[4];
            post = p;
        });

    if (post) {
        db_.query(
            "SELECT t.name FROM tags t JOIN post_tags pt ON pt.tag_id = t.id "
            "WHERE pt.post_id = $1 ORDER BY t.name",
            {std::to_string(post->id)},
            [&](const std::vector<std::string>& row) { post->tags.push_back(row[0]); });
    }
    return post;
}

} // namespace Instasave
