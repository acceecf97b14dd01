#include "core/index/sqlite_chunk_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <sqlite3.h>
#include <QDateTime>
#include <QFile>
#include <QSet>
#include <QStringList>
#include <QtEndian>

namespace dr {

namespace {

bool isMemoryPath(const QString& dbPath)
{
    return dbPath == QLatin1String(":memory:") || dbPath.isEmpty();
}

} // anonymous namespace

SQLiteChunkStore::~SQLiteChunkStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

SQLiteChunkStore& SQLiteChunkStore::operator=(SQLiteChunkStore&& other) noexcept
{
    if (this != &other) {
        if (m_db) {
            sqlite3_close(m_db);
        }
        m_db = other.m_db;
        other.m_db = nullptr;
    }
    return *this;
}

std::optional<SQLiteChunkStore> SQLiteChunkStore::open(const QString& dbPath)
{
    SQLiteChunkStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SQLiteChunkStore::init(const QString& dbPath)
{
    const QByteArray path = isMemoryPath(dbPath) ? QByteArrayLiteral(":memory:")
                                                 : dbPath.toUtf8();
    int rc = sqlite3_open(path.constData(), &m_db);
    if (rc != SQLITE_OK) {
        LOG_ERROR(drIndex, "Failed to open database: %s", sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(drIndex, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='chunks'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(drIndex, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV1)) {
            LOG_ERROR(drIndex, "Failed to create schema");
            return false;
        }
    }

    if (!isMemoryPath(dbPath)) {
        // Chunk content is user data: owner-only permissions
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
        QFile walFile(dbPath + QStringLiteral("-wal"));
        if (walFile.exists()) {
            walFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
        }
    }

    LOG_INFO(drIndex, "Chunk store opened: %s", path.constData());
    return true;
}

bool SQLiteChunkStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(drIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

std::optional<std::vector<Chunk>> SQLiteChunkStore::listChunks(
    const QString& ownerId,
    const std::optional<std::vector<int64_t>>& documentIdAllowList)
{
    const bool scoped = documentIdAllowList.has_value() && !documentIdAllowList->empty();
    const bool bindIds = scoped
        && static_cast<int>(documentIdAllowList->size()) <= kMaxBoundDocumentIds;

    QString sql = QStringLiteral(
        "SELECT chunk_id, document_id, chunk_index, owner_id, content, embedding, dimensions "
        "FROM chunks WHERE owner_id = ?1");
    if (bindIds) {
        QStringList placeholders;
        for (size_t i = 0; i < documentIdAllowList->size(); ++i) {
            placeholders.append(QStringLiteral("?%1").arg(static_cast<int>(i) + 2));
        }
        sql += QStringLiteral(" AND document_id IN (%1)").arg(placeholders.join(QLatin1Char(',')));
    }
    sql += QStringLiteral(" ORDER BY document_id, chunk_index");

    const QByteArray sqlUtf8 = sql.toUtf8();
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlUtf8.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(drIndex, "listChunks prepare: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    const QByteArray ownerUtf8 = ownerId.toUtf8();
    sqlite3_bind_text(stmt, 1, ownerUtf8.constData(), -1, SQLITE_STATIC);
    if (bindIds) {
        for (size_t i = 0; i < documentIdAllowList->size(); ++i) {
            sqlite3_bind_int64(stmt, static_cast<int>(i) + 2,
                               static_cast<sqlite3_int64>((*documentIdAllowList)[i]));
        }
    }

    QSet<qint64> allowed;
    if (scoped && !bindIds) {
        for (int64_t id : *documentIdAllowList) {
            allowed.insert(static_cast<qint64>(id));
        }
    }

    std::vector<Chunk> chunks;
    int skipped = 0;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const int64_t documentId = sqlite3_column_int64(stmt, 1);
        if (!allowed.isEmpty() && !allowed.contains(static_cast<qint64>(documentId))) {
            continue;
        }

        const char* content = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4));
        if (!content || content[0] == '\0') {
            ++skipped;
            continue;
        }

        Chunk chunk;
        chunk.chunkId = QString::fromUtf8(
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
        chunk.documentId = documentId;
        chunk.chunkIndex = sqlite3_column_int(stmt, 2);
        chunk.ownerId = QString::fromUtf8(
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3)));
        chunk.content = QString::fromUtf8(content);

        const void* blob = sqlite3_column_blob(stmt, 5);
        const int blobBytes = sqlite3_column_bytes(stmt, 5);
        const int dimensions = sqlite3_column_int(stmt, 6);
        if (blob && blobBytes > 0) {
            if (blobBytes != dimensions * static_cast<int>(sizeof(float))) {
                LOG_WARN(drIndex, "Chunk %s: embedding blob has %d bytes for %d dimensions",
                         qUtf8Printable(chunk.chunkId), blobBytes, dimensions);
            } else {
                chunk.embedding = decodeEmbedding(blob, blobBytes);
            }
        }
        chunks.push_back(std::move(chunk));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERROR(drIndex, "listChunks step: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(stmt);
        return std::nullopt;
    }
    sqlite3_finalize(stmt);

    if (skipped > 0) {
        LOG_WARN(drIndex, "Skipped %d chunk(s) with empty content", skipped);
    }

    LOG_DEBUG(drIndex, "listChunks owner=%s scoped=%d -> %d chunk(s)",
              ownerUtf8.constData(), scoped ? 1 : 0, static_cast<int>(chunks.size()));
    return chunks;
}

bool SQLiteChunkStore::insertChunks(const std::vector<Chunk>& chunks)
{
    // SAVEPOINT so this nests inside a caller's transaction
    if (!execSql("SAVEPOINT insert_chunks")) return false;

    const char* sql = R"(
        INSERT INTO chunks (chunk_id, document_id, chunk_index, owner_id, content,
                            embedding, dimensions, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
        ON CONFLICT(document_id, chunk_index) DO UPDATE SET
            chunk_id = excluded.chunk_id,
            owner_id = excluded.owner_id,
            content = excluded.content,
            embedding = excluded.embedding,
            dimensions = excluded.dimensions
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(drIndex, "chunk insert prepare: %s", sqlite3_errmsg(m_db));
        execSql("ROLLBACK TO SAVEPOINT insert_chunks");
        execSql("RELEASE SAVEPOINT insert_chunks");
        return false;
    }

    const double now = static_cast<double>(QDateTime::currentSecsSinceEpoch());

    for (const auto& chunk : chunks) {
        const QString chunkId = chunk.chunkId.isEmpty()
            ? computeChunkId(chunk.documentId, chunk.chunkIndex)
            : chunk.chunkId;
        const QByteArray idUtf8 = chunkId.toUtf8();
        const QByteArray ownerUtf8 = chunk.ownerId.toUtf8();
        const QByteArray textUtf8 = chunk.content.toUtf8();
        const QByteArray blob = encodeEmbedding(chunk.embedding);

        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(chunk.documentId));
        sqlite3_bind_int(stmt, 3, chunk.chunkIndex);
        sqlite3_bind_text(stmt, 4, ownerUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 5, textUtf8.constData(), -1, SQLITE_STATIC);
        if (blob.isEmpty()) {
            sqlite3_bind_null(stmt, 6);
        } else {
            sqlite3_bind_blob(stmt, 6, blob.constData(), blob.size(), SQLITE_STATIC);
        }
        sqlite3_bind_int(stmt, 7, static_cast<int>(chunk.embedding.size()));
        sqlite3_bind_double(stmt, 8, now);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_ERROR(drIndex, "chunk insert failed for document %lld #%d: %s",
                      static_cast<long long>(chunk.documentId), chunk.chunkIndex,
                      sqlite3_errmsg(m_db));
            sqlite3_finalize(stmt);
            execSql("ROLLBACK TO SAVEPOINT insert_chunks");
            execSql("RELEASE SAVEPOINT insert_chunks");
            return false;
        }
    }
    sqlite3_finalize(stmt);

    return execSql("RELEASE SAVEPOINT insert_chunks");
}

bool SQLiteChunkStore::deleteDocument(int64_t documentId)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM chunks WHERE document_id = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(drIndex, "deleteDocument prepare: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(documentId));
    const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok) {
        LOG_ERROR(drIndex, "deleteDocument failed: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return ok;
}

std::optional<int> SQLiteChunkStore::countChunks(const QString& ownerId)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT COUNT(*) FROM chunks WHERE owner_id = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(drIndex, "countChunks prepare: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    const QByteArray ownerUtf8 = ownerId.toUtf8();
    sqlite3_bind_text(stmt, 1, ownerUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<int> count;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

QByteArray SQLiteChunkStore::encodeEmbedding(const std::vector<float>& embedding)
{
    QByteArray bytes(static_cast<int>(embedding.size() * sizeof(float)), Qt::Uninitialized);
    uchar* out = reinterpret_cast<uchar*>(bytes.data());
    for (size_t i = 0; i < embedding.size(); ++i) {
        qToLittleEndian<float>(embedding[i], out + i * sizeof(float));
    }
    return bytes;
}

std::vector<float> SQLiteChunkStore::decodeEmbedding(const void* data, int byteCount)
{
    std::vector<float> embedding;
    if (!data || byteCount <= 0) {
        return embedding;
    }
    const int count = byteCount / static_cast<int>(sizeof(float));
    embedding.reserve(static_cast<size_t>(count));
    const uchar* in = static_cast<const uchar*>(data);
    for (int i = 0; i < count; ++i) {
        embedding.push_back(qFromLittleEndian<float>(in + i * sizeof(float)));
    }
    return embedding;
}

} // namespace dr
