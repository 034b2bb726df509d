#include "chatstore/storage/schema.hpp"

namespace chatstore::storage {

void create_tables(SQLite::Database& db) {
    SQLite::Transaction txn(db);

    db.exec(R"SQL(
        CREATE TABLE IF NOT EXISTS channels (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            type TEXT NOT NULL DEFAULT 'public',
            created_by TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        )
    )SQL");

    db.exec(R"SQL(
        CREATE TABLE IF NOT EXISTS channel_members (
            channel_id TEXT NOT NULL REFERENCES channels(id) ON DELETE CASCADE,
            user_id TEXT NOT NULL,
            role TEXT NOT NULL DEFAULT 'member',
            joined_at INTEGER NOT NULL,
            PRIMARY KEY (channel_id, user_id)
        )
    )SQL");

    db.exec(R"SQL(
        CREATE INDEX IF NOT EXISTS idx_channel_members_user ON channel_members(user_id)
    )SQL");

    // idempotency_key UNIQUE is what makes concurrent creates with the same
    // key collapse to one row. NULL keys never collide.
    db.exec(R"SQL(
        CREATE TABLE IF NOT EXISTS messages (
            id TEXT PRIMARY KEY,
            channel_id TEXT NOT NULL,
            user_id TEXT NOT NULL,
            content TEXT NOT NULL,
            message_type TEXT NOT NULL DEFAULT 'text',
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            idempotency_key TEXT UNIQUE
        )
    )SQL");

    db.exec(R"SQL(
        CREATE INDEX IF NOT EXISTS idx_messages_channel_created
        ON messages(channel_id, created_at DESC)
    )SQL");

    txn.commit();
}

} // namespace chatstore::storage
