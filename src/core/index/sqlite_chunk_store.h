#pragma once

#include "core/index/chunk_store.h"

#include <QByteArray>
#include <QString>
#include <optional>
#include <vector>

struct sqlite3;

namespace dr {

// SQLiteChunkStore -- owner of one SQLite connection holding the chunk
// table. Writes exist for ingestion and fixtures; retrieval only reads.
class SQLiteChunkStore : public ChunkStore {
public:
    ~SQLiteChunkStore() override;

    // Move-only (owns sqlite3* handle)
    SQLiteChunkStore(SQLiteChunkStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SQLiteChunkStore& operator=(SQLiteChunkStore&& other) noexcept;
    SQLiteChunkStore(const SQLiteChunkStore&) = delete;
    SQLiteChunkStore& operator=(const SQLiteChunkStore&) = delete;

    // Open or create the database at the given path (":memory:" allowed).
    static std::optional<SQLiteChunkStore> open(const QString& dbPath);

    std::optional<std::vector<Chunk>> listChunks(
        const QString& ownerId,
        const std::optional<std::vector<int64_t>>& documentIdAllowList) override;

    // Insert or replace chunks in one savepoint. Missing chunk IDs are
    // computed from (documentId, chunkIndex).
    bool insertChunks(const std::vector<Chunk>& chunks);

    bool deleteDocument(int64_t documentId);

    std::optional<int> countChunks(const QString& ownerId);

    sqlite3* rawDb() const { return m_db; }

    static QByteArray encodeEmbedding(const std::vector<float>& embedding);
    static std::vector<float> decodeEmbedding(const void* data, int byteCount);

private:
    SQLiteChunkStore() = default;

    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    // Above this many IDs the allow-list is applied in memory instead of
    // through bound IN (...) parameters.
    static constexpr int kMaxBoundDocumentIds = 500;

    sqlite3* m_db = nullptr;
};

} // namespace dr
