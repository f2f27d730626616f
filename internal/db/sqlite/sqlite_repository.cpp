#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstring>
#include <stdexcept>

#include "internal/db/sql/row_codec.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/text.hpp"
#include "recall/memory/v1.hpp"

namespace recall::db::sqlite {

using recall::db::ErrorCode;
using recall::db::Result;
namespace v1 = recall::memory::v1;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

static void BindEmbedding(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    if (v.empty()) {
        sqlite3_bind_null(st, idx);
        return;
    }
    sqlite3_bind_blob(st, idx, v.data(), static_cast<int>(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static std::vector<float> ColEmbedding(sqlite3_stmt* st, int col) {
    const void* blob  = sqlite3_column_blob(st, col);
    const int   bytes = sqlite3_column_bytes(st, col);
    if (!blob || bytes <= 0) return {};
    std::vector<float> out(static_cast<std::size_t>(bytes) / sizeof(float));
    std::memcpy(out.data(), blob, out.size() * sizeof(float));
    return out;
}

namespace {

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&)            = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }

    // Steps a read; SQLITE_ROW or SQLITE_DONE, throws otherwise.
    bool Next() {
        const int rc = sqlite3_step(st_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
    }

private:
    sqlite3*      db_;
    sqlite3_stmt* st_ = nullptr;
};

static void BindOptionalDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
    if (v) {
        sqlite3_bind_double(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static std::optional<double> ColOptionalDouble(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(st, col);
}

// Binds columns 2..30 of a memory row starting at `idx`.
int BindMemoryBody(sqlite3_stmt* st, int idx, const model::MemoryRecord& r) {
    BindText(st, idx++, r.owner_id);
    BindI32(st, idx++, static_cast<int>(r.kind));
    BindText(st, idx++, r.subject_name);
    BindText(st, idx++, r.content);
    BindText(st, idx++, r.predicate);
    BindText(st, idx++, r.object);
    BindText(st, idx++, sql::JoinList(r.aliases));
    BindEmbedding(st, idx++, r.embedding);
    BindText(st, idx++, r.embedding_model);
    BindDouble(st, idx++, r.importance);
    BindOptionalDouble(st, idx++, r.sentiment);
    BindI32(st, idx++, r.is_historical ? 1 : 0);
    BindI32(st, idx++, r.user_pinned ? 1 : 0);
    BindU64(st, idx++, r.effective_from_ms);
    BindU64(st, idx++, r.expires_at_ms);
    BindText(st, idx++, r.recurrence_json);
    BindI32(st, idx++, static_cast<int>(r.sensitivity));
    BindI32(st, idx++, static_cast<int>(r.status));
    BindText(st, idx++, r.category);
    BindText(st, idx++, r.supersedes_id);
    BindText(st, idx++, r.superseded_by_id);
    BindU64(st, idx++, r.version);
    BindU64(st, idx++, r.revision);
    BindU64(st, idx++, r.access_count);
    BindU64(st, idx++, r.last_accessed_at_ms);
    BindU64(st, idx++, r.decayed_at_ms);
    BindU64(st, idx++, r.created_at_ms);
    BindU64(st, idx++, r.updated_at_ms);
    BindOptionalDouble(st, idx++, r.sentiment_average);
    return idx;
}

model::MemoryRecord ReadMemory(sqlite3_stmt* st) {
    model::MemoryRecord r;
    r.id              = ColText(st, 0);
    r.owner_id        = ColText(st, 1);
    r.kind            = static_cast<v1::MemoryKind>(ColI32(st, 2));
    r.subject_name    = ColText(st, 3);
    r.content         = ColText(st, 4);
    r.predicate       = ColText(st, 5);
    r.object          = ColText(st, 6);
    r.aliases         = sql::SplitList(ColText(st, 7));
    r.embedding       = ColEmbedding(st, 8);
    r.embedding_model = ColText(st, 9);
    r.importance      = sqlite3_column_double(st, 10);
    r.sentiment       = ColOptionalDouble(st, 11);
    r.is_historical       = ColI32(st, 12) != 0;
    r.user_pinned         = ColI32(st, 13) != 0;
    r.effective_from_ms   = ColU64(st, 14);
    r.expires_at_ms       = ColU64(st, 15);
    r.recurrence_json     = ColText(st, 16);
    r.sensitivity         = static_cast<v1::Sensitivity>(ColI32(st, 17));
    r.status              = static_cast<v1::RecordStatus>(ColI32(st, 18));
    r.category            = ColText(st, 19);
    r.supersedes_id       = ColText(st, 20);
    r.superseded_by_id    = ColText(st, 21);
    r.version             = ColU64(st, 22);
    r.revision            = ColU64(st, 23);
    r.access_count        = ColU64(st, 24);
    r.last_accessed_at_ms = ColU64(st, 25);
    r.decayed_at_ms       = ColU64(st, 26);
    r.created_at_ms       = ColU64(st, 27);
    r.updated_at_ms       = ColU64(st, 28);
    r.sentiment_average   = ColOptionalDouble(st, 29);
    return r;
}

model::CategorySummaryRecord ReadSummary(sqlite3_stmt* st) {
    model::CategorySummaryRecord r;
    r.owner_id               = ColText(st, 0);
    r.category               = ColText(st, 1);
    r.summary_text           = ColText(st, 2);
    r.member_record_ids      = sql::SplitList(ColText(st, 3));
    r.member_fingerprint     = ColText(st, 4);
    r.version                = ColU64(st, 5);
    r.last_synthesized_at_ms = ColU64(st, 6);
    return r;
}

model::MemoryOperationRecord ReadOperation(sqlite3_stmt* st) {
    model::MemoryOperationRecord r;
    r.id             = ColText(st, 0);
    r.owner_id       = ColText(st, 1);
    r.operation      = static_cast<v1::Operation>(ColI32(st, 2));
    r.merge_strategy = static_cast<v1::MergeStrategy>(ColI32(st, 3));
    r.outcome        = static_cast<v1::OperationOutcome>(ColI32(st, 4));
    r.candidate_text = ColText(st, 5);
    r.candidate_json = ColText(st, 6);
    r.similar_ids    = sql::SplitList(ColText(st, 7));
    r.target_id      = ColText(st, 8);
    r.result_ids     = sql::SplitList(ColText(st, 9));
    r.reasoning      = ColText(st, 10);
    r.old_content    = ColText(st, 11);
    r.new_content    = ColText(st, 12);
    r.snapshot_json  = ColText(st, 13);
    r.error          = ColText(st, 14);
    r.job_id         = ColText(st, 15);
    r.source_id      = ColText(st, 16);
    r.duration_ms    = ColU64(st, 17);
    r.created_at_ms  = ColU64(st, 18);
    return r;
}

int BindJobBody(sqlite3_stmt* st, int idx, const model::MaintenanceJobRecord& r) {
    BindI32(st, idx++, static_cast<int>(r.job_type));
    BindI32(st, idx++, static_cast<int>(r.status));
    BindText(st, idx++, r.owner_id);
    BindText(st, idx++, r.payload_json);
    BindU64(st, idx++, r.attempts);
    BindU64(st, idx++, r.max_attempts);
    BindU64(st, idx++, r.scheduled_for_ms);
    BindText(st, idx++, r.depends_on);
    BindText(st, idx++, r.last_error);
    BindU64(st, idx++, r.created_at_ms);
    BindU64(st, idx++, r.started_at_ms);
    BindU64(st, idx++, r.completed_at_ms);
    return idx;
}

model::MaintenanceJobRecord ReadJob(sqlite3_stmt* st) {
    model::MaintenanceJobRecord r;
    r.id               = ColText(st, 0);
    r.job_type         = static_cast<v1::JobType>(ColI32(st, 1));
    r.status           = static_cast<v1::JobStatus>(ColI32(st, 2));
    r.owner_id         = ColText(st, 3);
    r.payload_json     = ColText(st, 4);
    r.attempts         = static_cast<uint32_t>(ColU64(st, 5));
    r.max_attempts     = static_cast<uint32_t>(ColU64(st, 6));
    r.scheduled_for_ms = ColU64(st, 7);
    r.depends_on       = ColText(st, 8);
    r.last_error       = ColText(st, 9);
    r.created_at_ms    = ColU64(st, 10);
    r.started_at_ms    = ColU64(st, 11);
    r.completed_at_ms  = ColU64(st, 12);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Memory records
// ------------------------------------------------------------------

Result SqliteRepository::InsertMemory(Transaction& t, const model::MemoryRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_MEMORY);

    BindText(st.get(), 1, r.id);
    BindMemoryBody(st.get(), 2, r);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MemoryRecord> SqliteRepository::GetMemory(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_MEMORY);
    BindText(st.get(), 1, id);
    if (!st.Next()) return std::nullopt;
    return ReadMemory(st.get());
}

Result SqliteRepository::UpdateMemory(Transaction& t, const model::MemoryRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPDATE_MEMORY);

    const int next = BindMemoryBody(st.get(), 1, r);
    BindText(st.get(), next, r.id);

    const auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "memory not found");
    return Result::Ok();
}

Result SqliteRepository::DeleteMemory(Transaction& t, const std::string& id) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::DELETE_MEMORY);
    BindText(st.get(), 1, id);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MemoryRecord> SqliteRepository::GetActiveBySlot(Transaction& t, const std::string& owner_id,
                                                                    const std::string& subject,
                                                                    const std::string& predicate) {
    const auto predicate_key = util::NormalizeKey(predicate);
    if (predicate_key.empty()) return std::nullopt;

    Statement st(TX(t).Handle(), sql::SELECT_ACTIVE_BY_SLOT);
    BindText(st.get(), 1, owner_id);
    BindText(st.get(), 2, util::NormalizeKey(subject));
    BindText(st.get(), 3, predicate_key);
    if (!st.Next()) return std::nullopt;
    return ReadMemory(st.get());
}

std::vector<model::MemoryRecord> SqliteRepository::ListMemories(Transaction& t, const model::MemoryFilter& filter) {
    std::string query = sql::SELECT_MEMORIES_BY_OWNER;
    if (filter.status) query += sql::MEMORY_FILTER_STATUS;
    if (filter.subject_key) query += sql::MEMORY_FILTER_SUBJECT;
    if (filter.category) query += sql::MEMORY_FILTER_CATEGORY;
    query += sql::MEMORY_ORDER;

    Statement st(TX(t).Handle(), query);
    int       idx = 1;
    BindText(st.get(), idx++, filter.owner_id);
    if (filter.status) BindI32(st.get(), idx++, static_cast<int>(*filter.status));
    if (filter.subject_key) BindText(st.get(), idx++, *filter.subject_key);
    if (filter.category) BindText(st.get(), idx++, *filter.category);

    std::vector<model::MemoryRecord> out;
    while (st.Next()) out.push_back(ReadMemory(st.get()));
    return out;
}

std::vector<std::string> SqliteRepository::ListOwners(Transaction& t) {
    Statement                st(TX(t).Handle(), sql::SELECT_OWNERS);
    std::vector<std::string> out;
    while (st.Next()) out.push_back(ColText(st.get(), 0));
    return out;
}

// ------------------------------------------------------------------
// Category summaries
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCategorySummary(Transaction& t, const model::CategorySummaryRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPSERT_SUMMARY);
    BindText(st.get(), 1, r.owner_id);
    BindText(st.get(), 2, r.category);
    BindText(st.get(), 3, r.summary_text);
    BindText(st.get(), 4, sql::JoinList(r.member_record_ids));
    BindText(st.get(), 5, r.member_fingerprint);
    BindU64(st.get(), 6, r.version);
    BindU64(st.get(), 7, r.last_synthesized_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CategorySummaryRecord> SqliteRepository::GetCategorySummary(Transaction& t,
                                                                                  const std::string& owner_id,
                                                                                  const std::string& category) {
    Statement st(TX(t).Handle(), sql::SELECT_SUMMARY);
    BindText(st.get(), 1, owner_id);
    BindText(st.get(), 2, category);
    if (!st.Next()) return std::nullopt;
    return ReadSummary(st.get());
}

std::vector<model::CategorySummaryRecord> SqliteRepository::ListCategorySummaries(Transaction& t,
                                                                                  const std::string& owner_id) {
    Statement st(TX(t).Handle(), sql::SELECT_SUMMARIES_BY_OWNER);
    BindText(st.get(), 1, owner_id);
    std::vector<model::CategorySummaryRecord> out;
    while (st.Next()) out.push_back(ReadSummary(st.get()));
    return out;
}

Result SqliteRepository::DeleteCategorySummary(Transaction& t, const std::string& owner_id, const std::string& category) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::DELETE_SUMMARY);
    BindText(st.get(), 1, owner_id);
    BindText(st.get(), 2, category);
    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Audit log
// ------------------------------------------------------------------

Result SqliteRepository::AppendOperation(Transaction& t, const model::MemoryOperationRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_OPERATION);
    auto*     s = st.get();
    BindText(s, 1, r.id);
    BindText(s, 2, r.owner_id);
    BindI32(s, 3, static_cast<int>(r.operation));
    BindI32(s, 4, static_cast<int>(r.merge_strategy));
    BindI32(s, 5, static_cast<int>(r.outcome));
    BindText(s, 6, r.candidate_text);
    BindText(s, 7, r.candidate_json);
    BindText(s, 8, sql::JoinList(r.similar_ids));
    BindText(s, 9, r.target_id);
    BindText(s, 10, sql::JoinList(r.result_ids));
    BindText(s, 11, r.reasoning);
    BindText(s, 12, r.old_content);
    BindText(s, 13, r.new_content);
    BindText(s, 14, r.snapshot_json);
    BindText(s, 15, r.error);
    BindText(s, 16, r.job_id);
    BindText(s, 17, r.source_id);
    BindU64(s, 18, r.duration_ms);
    BindU64(s, 19, r.created_at_ms);
    return Translate(db, sqlite3_step(s));
}

std::vector<model::MemoryOperationRecord> SqliteRepository::ListOperations(Transaction& t, const std::string& owner_id,
                                                                           uint64_t limit) {
    std::string query = sql::SELECT_OPERATIONS;
    if (limit > 0) query += " LIMIT " + std::to_string(limit);
    query += ";";

    Statement st(TX(t).Handle(), query);
    BindText(st.get(), 1, owner_id);
    std::vector<model::MemoryOperationRecord> out;
    while (st.Next()) out.push_back(ReadOperation(st.get()));
    return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::MaintenanceJobRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_JOB);
    BindText(st.get(), 1, r.id);
    BindJobBody(st.get(), 2, r);
    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MaintenanceJobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
    Statement st(TX(t).Handle(), sql::SELECT_JOB);
    BindText(st.get(), 1, id);
    if (!st.Next()) return std::nullopt;
    return ReadJob(st.get());
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::MaintenanceJobRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPDATE_JOB);
    const int next = BindJobBody(st.get(), 1, r);
    BindText(st.get(), next, r.id);

    const auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "job not found");
    return Result::Ok();
}

std::vector<model::MaintenanceJobRecord> SqliteRepository::ListJobs(Transaction& t,
                                                                    std::optional<v1::JobStatus> status) {
    Statement st(TX(t).Handle(), status ? sql::SELECT_JOBS_BY_STATUS : sql::SELECT_JOBS);
    if (status) BindI32(st.get(), 1, static_cast<int>(*status));
    std::vector<model::MaintenanceJobRecord> out;
    while (st.Next()) out.push_back(ReadJob(st.get()));
    return out;
}

// ------------------------------------------------------------------
// Access log / relationships
// ------------------------------------------------------------------

Result SqliteRepository::InsertAccess(Transaction& t, const model::AccessRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_ACCESS);
    BindText(st.get(), 1, r.owner_id);
    BindText(st.get(), 2, r.record_id);
    BindText(st.get(), 3, r.batch_id);
    BindU64(st.get(), 4, r.accessed_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::AccessRecord> SqliteRepository::ListAccesses(Transaction& t, const std::string& owner_id) {
    Statement st(TX(t).Handle(), sql::SELECT_ACCESSES);
    BindText(st.get(), 1, owner_id);
    std::vector<model::AccessRecord> out;
    while (st.Next()) {
        model::AccessRecord r;
        r.owner_id       = ColText(st.get(), 0);
        r.record_id      = ColText(st.get(), 1);
        r.batch_id       = ColText(st.get(), 2);
        r.accessed_at_ms = ColU64(st.get(), 3);
        out.push_back(std::move(r));
    }
    return out;
}

Result SqliteRepository::UpsertRelationship(Transaction& t, const model::RelationshipRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::UPSERT_RELATIONSHIP);
    BindText(st.get(), 1, r.owner_id);
    BindText(st.get(), 2, r.record_a);
    BindText(st.get(), 3, r.record_b);
    BindU64(st.get(), 4, r.co_access_count);
    BindDouble(st.get(), 5, r.strength);
    BindU64(st.get(), 6, r.updated_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::RelationshipRecord> SqliteRepository::ListRelationships(Transaction& t, const std::string& owner_id) {
    Statement st(TX(t).Handle(), sql::SELECT_RELATIONSHIPS);
    BindText(st.get(), 1, owner_id);
    std::vector<model::RelationshipRecord> out;
    while (st.Next()) {
        model::RelationshipRecord r;
        r.owner_id        = ColText(st.get(), 0);
        r.record_a        = ColText(st.get(), 1);
        r.record_b        = ColText(st.get(), 2);
        r.co_access_count = ColU64(st.get(), 3);
        r.strength        = sqlite3_column_double(st.get(), 4);
        r.updated_at_ms   = ColU64(st.get(), 5);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Sentiment samples
// ------------------------------------------------------------------

Result SqliteRepository::AppendSentimentSample(Transaction& t, const model::SentimentSampleRecord& r) {
    auto*     db = TX(t).Handle();
    Statement st(db, sql::INSERT_SENTIMENT_SAMPLE);
    BindText(st.get(), 1, r.owner_id);
    BindText(st.get(), 2, r.subject_key);
    BindText(st.get(), 3, r.record_id);
    BindDouble(st.get(), 4, r.sentiment);
    BindText(st.get(), 5, r.source_id);
    BindU64(st.get(), 6, r.recorded_at_ms);
    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::SentimentSampleRecord> SqliteRepository::ListSentimentSamples(Transaction& t,
                                                                                 const std::string& owner_id,
                                                                                 const std::string& subject_key,
                                                                                 uint64_t limit) {
    std::string query = sql::SELECT_SENTIMENT_SAMPLES;
    if (limit > 0) query += " LIMIT " + std::to_string(limit);
    query += ";";

    Statement st(TX(t).Handle(), query);
    BindText(st.get(), 1, owner_id);
    BindText(st.get(), 2, subject_key);
    std::vector<model::SentimentSampleRecord> out;
    while (st.Next()) {
        model::SentimentSampleRecord r;
        r.owner_id       = ColText(st.get(), 0);
        r.subject_key    = ColText(st.get(), 1);
        r.record_id      = ColText(st.get(), 2);
        r.sentiment      = sqlite3_column_double(st.get(), 3);
        r.source_id      = ColText(st.get(), 4);
        r.recorded_at_ms = ColU64(st.get(), 5);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace recall::db::sqlite
