/**
 * @file DatabaseSchema.h
 * @brief SQLite schema definitions for the state store
 */

#pragma once

namespace ChunkDM {
namespace DatabaseSchema {

constexpr int CURRENT_SCHEMA_VERSION = 1;

constexpr const char* PRAGMAS[] = {
    "PRAGMA journal_mode = WAL",
    "PRAGMA synchronous = NORMAL",
    "PRAGMA foreign_keys = ON",
};

// ═══════════════════════════════════════════════════════════════════════════════
// Downloads Table
// ═══════════════════════════════════════════════════════════════════════════════

constexpr const char* CREATE_DOWNLOADS_TABLE = R"(
    CREATE TABLE IF NOT EXISTS downloads (
        id TEXT PRIMARY KEY NOT NULL,
        url TEXT NOT NULL,
        file_path TEXT NOT NULL,
        total_size INTEGER NOT NULL DEFAULT -1,
        bytes_transferred INTEGER NOT NULL DEFAULT 0,
        status INTEGER NOT NULL DEFAULT 0,
        error_message TEXT,
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL
    )
)";

constexpr const char* CREATE_DOWNLOADS_STATUS_INDEX = R"(
    CREATE INDEX IF NOT EXISTS idx_downloads_status ON downloads (status)
)";

// ═══════════════════════════════════════════════════════════════════════════════
// Chunks Table
// ═══════════════════════════════════════════════════════════════════════════════

constexpr const char* CREATE_CHUNKS_TABLE = R"(
    CREATE TABLE IF NOT EXISTS chunks (
        download_id TEXT NOT NULL,
        chunk_index INTEGER NOT NULL,
        start_byte INTEGER NOT NULL,
        end_byte INTEGER NOT NULL,
        current_byte INTEGER NOT NULL,
        completed INTEGER NOT NULL DEFAULT 0,
        PRIMARY KEY (download_id, chunk_index),
        FOREIGN KEY (download_id) REFERENCES downloads (id) ON DELETE CASCADE
    )
)";

constexpr const char* CREATE_CHUNKS_DOWNLOAD_INDEX = R"(
    CREATE INDEX IF NOT EXISTS idx_chunks_download ON chunks (download_id)
)";

} // namespace DatabaseSchema
} // namespace ChunkDM
