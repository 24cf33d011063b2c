// =============================================================================
// PostgreSQL Store Tests
// =============================================================================
//
// Statement building runs everywhere. The live tests need a reachable
// database (ENGRAM_DB_* variables) and are skipped otherwise.

#include <gtest/gtest.h>
#include "engram/config.hpp"
#include "engram/db/operations.hpp"
#include "engram/db/pg_store.hpp"
#include "engram/error.hpp"
#include "engram/store/schema.hpp"
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

using namespace engram;
using namespace engram::db;
namespace tables = store::tables;

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

// =============================================================================
// Statement building
// =============================================================================

TEST(PgStatementTest, QuoteIdentEscapesQuotes) {
    EXPECT_EQ(quote_ident("raw_memories"), "\"raw_memories\"");
    EXPECT_EQ(quote_ident("we\"ird"), "\"we\"\"ird\"");
}

TEST(PgStatementTest, UpsertUpdatesEveryColumnButId) {
    const std::string sql = build_upsert("clusters", {"id", "ts", "member_count"});
    EXPECT_TRUE(contains(sql, "INSERT INTO \"clusters\" (\"id\", \"ts\", \"member_count\")"));
    EXPECT_TRUE(contains(sql, "VALUES ($1, $2, $3)"));
    EXPECT_TRUE(contains(sql, "ON CONFLICT (id) DO UPDATE SET \"ts\" = EXCLUDED.\"ts\", "
                              "\"member_count\" = EXCLUDED.\"member_count\""));
    EXPECT_FALSE(contains(sql, "\"id\" = EXCLUDED"));
}

TEST(PgStatementTest, UpsertOfIdOnlyDoesNothingOnConflict) {
    EXPECT_TRUE(contains(build_upsert("t", {"id"}), "ON CONFLICT (id) DO NOTHING"));
}

TEST(PgStatementTest, EpisodeUpsertSkipsFinalStates) {
    const std::string guard = PgStore::update_guard_sql(store::schema_for(tables::EPISODES));
    EXPECT_EQ(guard, "\"episodes\".\"state\" NOT IN ('consolidated_to_ltm', 'discarded')");
    const std::string sql = build_upsert(tables::EPISODES, {"id", "ts", "state"}, guard);
    EXPECT_TRUE(contains(sql, "\"state\" = EXCLUDED.\"state\" WHERE \"episodes\".\"state\" NOT IN"));

    EXPECT_TRUE(PgStore::update_guard_sql(store::schema_for(tables::CLUSTERS)).empty());
    EXPECT_FALSE(contains(build_upsert("t", {"id"}, guard), "WHERE"));
}

TEST(PgStatementTest, CreateTableCarriesSchemaConstraints) {
    const std::string sql = PgStore::create_table_sql(store::schema_for(tables::RAW_MEMORIES));
    EXPECT_TRUE(contains(sql, "CREATE TABLE IF NOT EXISTS \"raw_memories\""));
    EXPECT_TRUE(contains(sql, "id TEXT COLLATE \"C\" PRIMARY KEY"));
    EXPECT_TRUE(contains(sql, "ts BIGINT NOT NULL"));
    EXPECT_TRUE(contains(sql, "\"salience\" DOUBLE PRECISION NOT NULL CHECK (\"salience\" >= 0"));
    EXPECT_TRUE(contains(sql, "CHECK (\"sentiment\" >= -1"));

    const std::string episodes = PgStore::create_table_sql(store::schema_for(tables::EPISODES));
    EXPECT_TRUE(contains(episodes, "\"state\" TEXT"));
    EXPECT_TRUE(contains(episodes, "IN ('pending'"));
}

TEST(PgStatementTest, EveryTableHasDdl) {
    for (const auto& schema : store::all_tables()) {
        const std::string sql = PgStore::create_table_sql(schema);
        EXPECT_TRUE(contains(sql, quote_ident(schema.name))) << schema.name;
        for (const auto& c : schema.columns) {
            EXPECT_TRUE(contains(sql, quote_ident(c.name))) << schema.name << "." << c.name;
        }
    }
}

// =============================================================================
// Live database
// =============================================================================

class PgStoreTest : public ::testing::Test {
protected:
    std::unique_ptr<PgStore> pg;
    std::string prefix;

    void SetUp() override {
        const DatabaseConfig config = load_config().database;
        {
            Connection check(config);
            if (!check.ok()) {
                GTEST_SKIP() << "Database connection failed: " << check.error();
            }
        }
        pg = std::make_unique<PgStore>(config);
        pg->ensure_schema();
        prefix = "pgtest-" + std::to_string(getpid()) + "-";
    }

    void TearDown() override {
        if (!pg) return;
        PooledConnection conn(pg->pool());
        for (const auto& schema : store::all_tables()) {
            exec_checked(conn.get(), "DELETE FROM " + quote_ident(schema.name) + " WHERE id LIKE $1",
                         {prefix + "%"});
        }
        exec_checked(conn.get(), "DELETE FROM watermarks WHERE stage LIKE $1", {prefix + "%"});
        exec_checked(conn.get(), "DELETE FROM run_locks WHERE stage LIKE $1", {prefix + "%"});
    }

    store::Record raw(const std::string& id, Timestamp ts, double salience = 0.5) {
        store::Record r(prefix + id, ts);
        r.content_hash = "h-" + id;
        r.set("content_ref", "note " + id).set("salience", salience).set("importance", 0.5)
         .set("sentiment", 0.0);
        return r;
    }

    std::vector<store::Record> mine(const std::string& table) {
        return pg->select(store::Selection{table, {store::where("id", store::Op::Ge, prefix),
                                                   store::where("id", store::Op::Lt, prefix + "~")},
                                           store::Order::ByTsThenId, 0});
    }
};

TEST_F(PgStoreTest, SchemaIsIdempotent) {
    EXPECT_NO_THROW(pg->ensure_schema());
}

TEST_F(PgStoreTest, CommitAndReadBack) {
    auto tx = pg->begin_transaction();
    tx->upsert_batch(tables::RAW_MEMORIES, {raw("b", 2000, 0.9), raw("a", 1000)});
    tx->set_watermark(prefix + "stage", store::Watermark{2000, prefix + "b", "h-b"});
    tx->commit();

    const auto rows = mine(tables::RAW_MEMORIES);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].id, prefix + "a");
    EXPECT_EQ(rows[0].content_hash, "h-a");
    EXPECT_DOUBLE_EQ(rows[1].real("salience"), 0.9);

    const auto wm = pg->get_watermark(prefix + "stage");
    ASSERT_TRUE(wm.has_value());
    EXPECT_EQ(wm->ts, 2000);
    EXPECT_EQ(wm->last_id, prefix + "b");
}

TEST_F(PgStoreTest, UpsertReplacesRow) {
    for (double s : {0.2, 0.7}) {
        auto tx = pg->begin_transaction();
        tx->upsert_batch(tables::RAW_MEMORIES, {raw("a", 1000, s)});
        tx->commit();
    }
    const auto rows = mine(tables::RAW_MEMORIES);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_DOUBLE_EQ(rows[0].real("salience"), 0.7);
}

TEST_F(PgStoreTest, FinalEpisodeKeepsItsState) {
    auto episode = [&](const std::string& state, int64_t replays) {
        store::Record r(prefix + "ep", 1000);
        r.set("category", "strategy").set("window_start", 1000).set("window_end", 2000)
         .set("item_count", 2).set("recency_factor", 0.5).set("emotional_salience", 0.5)
         .set("stm_strength", 0.5).set("hebbian_potential", 3).set("ready", true)
         .set("strength", 0.8).set("replay_count", replays).set("state", state);
        return r;
    };
    for (const auto& [state, replays] : std::vector<std::pair<std::string, int64_t>>{
             {"pending", 0}, {"consolidated_to_ltm", 1}, {"pending", 0}}) {
        auto tx = pg->begin_transaction();
        tx->upsert_batch(tables::EPISODES, {episode(state, replays)});
        tx->commit();
    }
    const auto rows = mine(tables::EPISODES);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].text("state"), "consolidated_to_ltm");
    EXPECT_EQ(rows[0].integer("replay_count"), 1);
}

TEST_F(PgStoreTest, UncommittedTransactionRollsBack) {
    {
        auto tx = pg->begin_transaction();
        tx->upsert_batch(tables::RAW_MEMORIES, {raw("a", 1000)});
    }
    EXPECT_TRUE(mine(tables::RAW_MEMORIES).empty());
}

TEST_F(PgStoreTest, CheckViolationIsDataIntegrityError) {
    PooledConnection conn(pg->pool());
    EXPECT_THROW(exec_checked(conn.get(),
                              "INSERT INTO raw_memories (id, ts, content_ref, salience, importance, sentiment) "
                              "VALUES ($1, 0, 'x', 1.5, 0.5, 0.0)",
                              {prefix + "bad"}, prefix + "bad"),
                 DataIntegrityError);
}

TEST_F(PgStoreTest, PendingIncludesCorrections) {
    auto tx = pg->begin_transaction();
    tx->upsert_batch(tables::RAW_MEMORIES, {raw("a", 1000), raw("b", 2000), raw("c", 3000)});
    store::Record member(prefix + "a", 1000);
    member.set("episode_id", prefix + "ep").set("category", "x").set("item_created_at", 1000)
          .set("importance", 0.5).set("sentiment", 0.0).set("source_hash", "stale");
    tx->upsert_batch(tables::EPISODE_MEMBERS, {member});
    tx->commit();

    store::PendingQuery q{tables::RAW_MEMORIES, tables::EPISODE_MEMBERS, store::Watermark{2000, prefix + "b", ""},
                          {store::where("id", store::Op::Ge, prefix), store::where("id", store::Op::Lt, prefix + "~")},
                          true, 0};
    const auto pending = pg->select_pending(q);
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].id, prefix + "a");
    EXPECT_EQ(pending[1].id, prefix + "c");
}

TEST_F(PgStoreTest, RunLockHonoursOwner) {
    const std::string stage = prefix + "lock";
    EXPECT_TRUE(pg->acquire_run_lock(stage, "host-a:1", 60));
    EXPECT_TRUE(pg->acquire_run_lock(stage, "host-a:1", 60));
    EXPECT_FALSE(pg->acquire_run_lock(stage, "host-b:2", 60));

    pg->release_run_lock(stage, "host-b:2");
    EXPECT_FALSE(pg->acquire_run_lock(stage, "host-b:2", 60));

    pg->release_run_lock(stage, "host-a:1");
    EXPECT_TRUE(pg->acquire_run_lock(stage, "host-b:2", 60));
}

TEST_F(PgStoreTest, ExpiredLockCanBeTaken) {
    const std::string stage = prefix + "ttl";
    EXPECT_TRUE(pg->acquire_run_lock(stage, "host-a:1", 0));
    EXPECT_TRUE(pg->acquire_run_lock(stage, "host-b:2", 60));
}

TEST_F(PgStoreTest, PoolReusesConnections) {
    {
        PooledConnection a(pg->pool());
        PooledConnection b(pg->pool());
    }
    const auto [idle, opened] = pg->pool().stats();
    EXPECT_EQ(idle, opened);
    EXPECT_GE(opened, 2u);
}
