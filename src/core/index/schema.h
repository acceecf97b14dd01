#pragma once

namespace dr {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -65536;
PRAGMA mmap_size = 30000000;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x445254;
PRAGMA user_version = 1;
)";

constexpr int kCurrentSchemaVersion = 1;

// Embeddings are stored as little-endian float32 BLOBs; `dimensions` is
// the float count so a truncated BLOB is detectable.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS chunks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    chunk_id TEXT NOT NULL UNIQUE,
    document_id INTEGER NOT NULL,
    chunk_index INTEGER NOT NULL,
    owner_id TEXT NOT NULL,
    content TEXT NOT NULL,
    embedding BLOB,
    dimensions INTEGER NOT NULL DEFAULT 0,
    created_at REAL NOT NULL,
    UNIQUE (document_id, chunk_index)
);

CREATE INDEX IF NOT EXISTS idx_chunks_owner_document
    ON chunks(owner_id, document_id, chunk_index);
)";

} // namespace dr
