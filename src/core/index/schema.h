#pragma once

namespace sift {

// Per-connection pragmas. No write lock required; safe on every open.
// busy_timeout is set high (30 s) so a second process (e.g. a CLI search
// while an ingest runs) waits out a document transaction.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -65536;
PRAGMA journal_size_limit = 33554432;
)";

// Database-level pragmas. Require the write lock; run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x53494654;
PRAGMA user_version = 1;
)";

// Chunk ids are AUTOINCREMENT so a deleted row id (used as the ANN label)
// is never handed out again.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS documents (
    id TEXT PRIMARY KEY,
    title TEXT NOT NULL,
    source TEXT NOT NULL,
    full_text TEXT NOT NULL,
    metadata TEXT NOT NULL DEFAULT '{}',
    created_at REAL NOT NULL,
    updated_at REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_documents_source ON documents(source);
CREATE INDEX IF NOT EXISTS idx_documents_created_at ON documents(created_at DESC);

CREATE TABLE IF NOT EXISTS chunks (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    chunk_id TEXT NOT NULL UNIQUE,
    document_id TEXT NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
    chunk_index INTEGER NOT NULL CHECK (chunk_index >= 0),
    content TEXT NOT NULL,
    embedding BLOB,
    embedding_dims INTEGER,
    token_count INTEGER,
    metadata TEXT NOT NULL DEFAULT '{}',
    UNIQUE(document_id, chunk_index)
);

CREATE INDEX IF NOT EXISTS idx_chunks_document_id ON chunks(document_id);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

constexpr int kCurrentSchemaVersion = 1;

// Settings-table key holding the corpus-wide embedding dimension.
constexpr const char* kEmbeddingDimensionsKey = "embedding_dimensions";

} // namespace sift
