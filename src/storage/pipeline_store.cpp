/**
 * @file pipeline_store.cpp
 * @brief SQLite persistence for the study-processing pipeline
 */

#include "aipacs/storage/pipeline_store.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <format>
#include <iomanip>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <sstream>

#include <sqlite3.h>

namespace aipacs::storage {

namespace {

/**
 * @brief Generate a unique, roughly time-ordered identifier
 */
std::string generate_id(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;
    static std::mutex gen_mutex;

    uint64_t random_part = 0;
    {
        std::lock_guard<std::mutex> lock(gen_mutex);
        random_part = dis(gen);
    }

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();

    std::ostringstream oss;
    oss << prefix << '-' << std::hex << std::setfill('0') << std::setw(12)
        << millis << std::setw(4) << (counter++ & 0xFFFF) << std::setw(8)
        << (random_part & 0xFFFFFFFF);
    return oss.str();
}

/**
 * @brief Report id for a job: job-<id> -> rpt-<id>
 */
std::string report_id_for(std::string_view job_id) {
    constexpr std::string_view job_prefix = "job-";
    if (job_id.starts_with(job_prefix)) {
        job_id.remove_prefix(job_prefix.size());
    }
    return std::format("rpt-{}", job_id);
}

/**
 * @brief Convert time_point to SQLite timestamp string
 */
std::string to_sqlite_timestamp(const time_point& tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::seconds>(tp));
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch())
                      .count() %
                  1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

/**
 * @brief Parse SQLite timestamp string to time_point
 *
 * An empty string maps to the epoch.
 */
time_point from_sqlite_timestamp(const std::string& str) {
    if (str.empty()) {
        return time_point{};
    }

    std::tm tm_val{};
    int millis = 0;

    // Parse: "YYYY-MM-DD HH:MM:SS.mmm"
    std::istringstream iss(str);
    iss >> std::get_time(&tm_val, "%Y-%m-%d %H:%M:%S");
    if (iss.fail()) {
        return time_point{};
    }
    if (iss.peek() == '.') {
        iss.ignore();
        iss >> millis;
    }

    auto time_t_val = timegm(&tm_val);
    return std::chrono::system_clock::from_time_t(time_t_val) +
           std::chrono::milliseconds(millis);
}

// =============================================================================
// SQLite helpers
// =============================================================================

/**
 * @brief Owning wrapper for a prepared statement
 */
class statement {
public:
    statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }

    ~statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    [[nodiscard]] bool ok() const noexcept { return stmt_ != nullptr; }

    statement& bind(int index, std::string_view value) {
        sqlite3_bind_text(stmt_, index, value.data(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT);
        return *this;
    }

    statement& bind(int index, const char* value) {
        return bind(index, std::string_view(value));
    }

    statement& bind(int index, const std::string& value) {
        return bind(index, std::string_view(value));
    }

    statement& bind(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
        return *this;
    }

    statement& bind(int index, int value) {
        sqlite3_bind_int(stmt_, index, value);
        return *this;
    }

    statement& bind(int index, double value) {
        sqlite3_bind_double(stmt_, index, value);
        return *this;
    }

    statement& bind_null(int index) {
        sqlite3_bind_null(stmt_, index);
        return *this;
    }

    statement& bind_blob(int index, std::string_view value) {
        sqlite3_bind_blob(stmt_, index, value.data(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT);
        return *this;
    }

    int step() { return sqlite3_step(stmt_); }

    [[nodiscard]] std::string text(int col) const {
        const auto* value =
            reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return value ? std::string(value) : std::string{};
    }

    [[nodiscard]] std::string blob(int col) const {
        const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt_, col));
        int size = sqlite3_column_bytes(stmt_, col);
        return data ? std::string(data, static_cast<size_t>(size)) : std::string{};
    }

    [[nodiscard]] bool is_null(int col) const {
        return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
    }

    [[nodiscard]] int64_t int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

    [[nodiscard]] double real(int col) const {
        return sqlite3_column_double(stmt_, col);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * @brief Immediate transaction rolled back unless committed
 */
class transaction {
public:
    explicit transaction(sqlite3* db) : db_(db) {
        active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr,
                               nullptr) == SQLITE_OK;
    }

    ~transaction() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    [[nodiscard]] bool active() const noexcept { return active_; }

    [[nodiscard]] bool commit() {
        if (!active_) {
            return false;
        }
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            return false;
        }
        active_ = false;
        return true;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

// =============================================================================
// Measurement encoding
// =============================================================================

std::string escape_json(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            default:
                out += c;
        }
    }
    return out;
}

std::string encode_measurements(const std::map<std::string, double>& values) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : values) {
        if (!first) out += ',';
        first = false;
        out += std::format("\"{}\":{}", escape_json(key), value);
    }
    out += '}';
    return out;
}

/**
 * @brief Decode a flat {"name": number} object written by encode_measurements
 */
std::map<std::string, double> decode_measurements(std::string_view text) {
    std::map<std::string, double> values;
    size_t pos = 0;
    auto skip_ws = [&] {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    };

    skip_ws();
    if (pos >= text.size() || text[pos] != '{') return values;
    ++pos;

    while (pos < text.size()) {
        skip_ws();
        if (pos < text.size() && text[pos] == '}') break;
        if (text[pos] != '"') break;
        ++pos;

        std::string key;
        while (pos < text.size() && text[pos] != '"') {
            if (text[pos] == '\\' && pos + 1 < text.size()) {
                ++pos;
                key += text[pos] == 'n' ? '\n' : text[pos];
            } else {
                key += text[pos];
            }
            ++pos;
        }
        ++pos;

        skip_ws();
        if (pos >= text.size() || text[pos] != ':') break;
        ++pos;
        skip_ws();

        size_t end = pos;
        while (end < text.size() && text[end] != ',' && text[end] != '}') {
            ++end;
        }
        std::string number(text.substr(pos, end - pos));
        char* parse_end = nullptr;
        double value = std::strtod(number.c_str(), &parse_end);
        if (parse_end != number.c_str()) {
            values[key] = value;
        }
        pos = end;
        if (pos < text.size() && text[pos] == ',') ++pos;
    }
    return values;
}

constexpr const char* JOB_COLUMNS =
    "job_id, study_uid, state, attempt_count, instance_count, last_error, "
    "error_stage, lease_owner, lease_expires_at, lease_generation, "
    "next_attempt_at, created_at, updated_at, finished_at";

job_record read_job(const statement& stmt) {
    job_record job;
    job.job_id = stmt.text(0);
    job.study_uid = stmt.text(1);
    job.state = pipeline::parse_job_state(stmt.text(2)).value_or(job_state::failed);
    job.attempt_count = static_cast<int>(stmt.int64(3));
    job.instance_count = static_cast<size_t>(stmt.int64(4));
    job.last_error = stmt.text(5);
    if (!stmt.is_null(6)) {
        job.error_stage = pipeline::parse_job_state(stmt.text(6));
    }
    job.lease_owner = stmt.text(7);
    if (!stmt.is_null(8)) {
        job.lease_expires_at = from_sqlite_timestamp(stmt.text(8));
    }
    job.lease_generation = stmt.int64(9);
    job.next_attempt_at = from_sqlite_timestamp(stmt.text(10));
    job.created_at = from_sqlite_timestamp(stmt.text(11));
    job.updated_at = from_sqlite_timestamp(stmt.text(12));
    if (!stmt.is_null(13)) {
        job.finished_at = from_sqlite_timestamp(stmt.text(13));
    }
    return job;
}

constexpr const char* INSTANCE_COLUMNS =
    "instance_uid, series_uid, study_uid, sop_class_uid, modality, "
    "payload_path, payload_size, received_at";

instance_record read_instance(const statement& stmt) {
    instance_record instance;
    instance.instance_uid = stmt.text(0);
    instance.series_uid = stmt.text(1);
    instance.study_uid = stmt.text(2);
    instance.sop_class_uid = stmt.text(3);
    instance.modality = stmt.text(4);
    instance.payload_path = stmt.text(5);
    instance.payload_size = static_cast<size_t>(stmt.int64(6));
    instance.received_at = from_sqlite_timestamp(stmt.text(7));
    return instance;
}

}  // namespace

// =============================================================================
// pipeline_store::impl
// =============================================================================

class pipeline_store::impl {
public:
    store_config config_;
    sqlite3* db_ = nullptr;
    mutable std::shared_mutex db_mutex_;

    explicit impl(const store_config& config) : config_(config) {}

    ~impl() { close(); }

    std::expected<void, store_error> open() {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (db_) {
            return std::unexpected(store_error::already_open);
        }
        if (!config_.is_valid()) {
            return std::unexpected(store_error::invalid_argument);
        }

        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        int rc = sqlite3_open_v2(config_.database_path.string().c_str(), &db_,
                                 flags, nullptr);
        if (rc != SQLITE_OK) {
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return std::unexpected(store_error::database_error);
        }

        if (config_.enable_wal_mode) {
            execute_sql("PRAGMA journal_mode=WAL");
            execute_sql("PRAGMA synchronous=NORMAL");
        }

        sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout.count()));

        if (auto result = create_tables(); !result) {
            sqlite3_close(db_);
            db_ = nullptr;
            return result;
        }

        return {};
    }

    void close() {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::expected<void, store_error> create_tables() {
        const char* studies_table = R"(
            CREATE TABLE IF NOT EXISTS studies (
                study_uid TEXT PRIMARY KEY,
                patient_id TEXT NOT NULL DEFAULT '',
                patient_name TEXT NOT NULL DEFAULT '',
                accession_number TEXT NOT NULL DEFAULT '',
                modality TEXT NOT NULL DEFAULT '',
                state TEXT NOT NULL
                    CHECK(state IN ('collecting', 'ready', 'closed')),
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL,
                last_instance_at TEXT NOT NULL DEFAULT ''
            )
        )";

        const char* instances_table = R"(
            CREATE TABLE IF NOT EXISTS instances (
                instance_uid TEXT PRIMARY KEY,
                series_uid TEXT NOT NULL,
                study_uid TEXT NOT NULL,
                sop_class_uid TEXT NOT NULL DEFAULT '',
                modality TEXT NOT NULL DEFAULT '',
                payload_path TEXT NOT NULL,
                payload_size INTEGER NOT NULL DEFAULT 0,
                received_at TEXT NOT NULL
            )
        )";

        const char* jobs_table = R"(
            CREATE TABLE IF NOT EXISTS jobs (
                job_id TEXT PRIMARY KEY,
                study_uid TEXT NOT NULL,
                state TEXT NOT NULL
                    CHECK(state IN ('received', 'queued', 'analyzing',
                                    'reporting', 'delivering', 'done',
                                    'failed')),
                attempt_count INTEGER NOT NULL DEFAULT 0,
                instance_count INTEGER NOT NULL DEFAULT 0,
                last_error TEXT NOT NULL DEFAULT '',
                error_stage TEXT,
                lease_owner TEXT,
                lease_expires_at TEXT,
                lease_generation INTEGER NOT NULL DEFAULT 0,
                next_attempt_at TEXT NOT NULL,
                created_at TEXT NOT NULL,
                updated_at TEXT NOT NULL,
                finished_at TEXT
            )
        )";

        const char* job_instances_table = R"(
            CREATE TABLE IF NOT EXISTS job_instances (
                job_id TEXT NOT NULL,
                instance_uid TEXT NOT NULL,
                PRIMARY KEY (job_id, instance_uid)
            )
        )";

        const char* events_table = R"(
            CREATE TABLE IF NOT EXISTS job_events (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                job_id TEXT NOT NULL,
                from_state TEXT,
                to_state TEXT NOT NULL,
                attempt INTEGER NOT NULL DEFAULT 0,
                detail TEXT NOT NULL DEFAULT '',
                at TEXT NOT NULL
            )
        )";

        const char* findings_table = R"(
            CREATE TABLE IF NOT EXISTS findings (
                job_id TEXT NOT NULL,
                ordinal INTEGER NOT NULL,
                category TEXT NOT NULL,
                confidence REAL NOT NULL
                    CHECK(confidence >= 0.0 AND confidence <= 1.0),
                x REAL NOT NULL DEFAULT 0,
                y REAL NOT NULL DEFAULT 0,
                z REAL NOT NULL DEFAULT 0,
                width REAL NOT NULL DEFAULT 1,
                height REAL NOT NULL DEFAULT 1,
                depth REAL NOT NULL DEFAULT 1,
                severity TEXT NOT NULL
                    CHECK(severity IN ('low', 'medium', 'high')),
                description TEXT NOT NULL DEFAULT '',
                measurements TEXT NOT NULL DEFAULT '{}',
                PRIMARY KEY (job_id, ordinal)
            )
        )";

        const char* reports_table = R"(
            CREATE TABLE IF NOT EXISTS reports (
                report_id TEXT PRIMARY KEY,
                job_id TEXT NOT NULL UNIQUE,
                study_uid TEXT NOT NULL,
                format TEXT NOT NULL,
                template_version TEXT NOT NULL DEFAULT '',
                content_type TEXT NOT NULL DEFAULT '',
                payload BLOB NOT NULL,
                payload_size INTEGER NOT NULL DEFAULT 0,
                finding_count INTEGER NOT NULL DEFAULT 0,
                delivery_state TEXT NOT NULL
                    CHECK(delivery_state IN ('pending', 'sent', 'failed')),
                archive_response TEXT NOT NULL DEFAULT '',
                sent_at TEXT,
                created_at TEXT NOT NULL
            )
        )";

        // The partial unique index backs the one-active-job-per-study rule.
        const char* required_indexes[] = {
            "CREATE UNIQUE INDEX IF NOT EXISTS idx_jobs_active_study "
            "ON jobs(study_uid) WHERE state NOT IN ('done', 'failed')"};

        const char* indexes[] = {
            "CREATE INDEX IF NOT EXISTS idx_instances_study ON instances(study_uid)",
            "CREATE INDEX IF NOT EXISTS idx_studies_state ON studies(state)",
            "CREATE INDEX IF NOT EXISTS idx_jobs_state ON jobs(state, next_attempt_at)",
            "CREATE INDEX IF NOT EXISTS idx_jobs_study ON jobs(study_uid)",
            "CREATE INDEX IF NOT EXISTS idx_events_job ON job_events(job_id)"};

        for (const auto* sql : {studies_table, instances_table, jobs_table,
                                job_instances_table, events_table, findings_table,
                                reports_table}) {
            if (!execute_sql(sql)) {
                return std::unexpected(store_error::database_error);
            }
        }

        for (const auto* idx : required_indexes) {
            if (!execute_sql(idx)) {
                return std::unexpected(store_error::database_error);
            }
        }

        for (const auto* idx : indexes) {
            execute_sql(idx);  // Secondary indexes are optional
        }

        return {};
    }

    bool execute_sql(const char* sql) {
        char* error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK) {
            if (error_msg) {
                sqlite3_free(error_msg);
            }
            return false;
        }
        return true;
    }

    // =========================================================================
    // Internal helpers (caller holds db_mutex_)
    // =========================================================================

    bool insert_event(std::string_view job_id, std::optional<job_state> from,
                      job_state to, int attempt, std::string_view detail,
                      const std::string& at) {
        statement stmt(db_,
                       "INSERT INTO job_events (job_id, from_state, to_state, "
                       "attempt, detail, at) VALUES (?, ?, ?, ?, ?, ?)");
        if (!stmt.ok()) return false;
        stmt.bind(1, job_id);
        if (from) {
            stmt.bind(2, pipeline::to_string(*from));
        } else {
            stmt.bind_null(2);
        }
        stmt.bind(3, pipeline::to_string(to))
            .bind(4, attempt)
            .bind(5, detail)
            .bind(6, at);
        return stmt.step() == SQLITE_DONE;
    }

    std::optional<job_record> get_job_internal(std::string_view job_id) const {
        auto sql = std::format("SELECT {} FROM jobs WHERE job_id = ?", JOB_COLUMNS);
        statement stmt(db_, sql.c_str());
        if (!stmt.ok()) return std::nullopt;
        stmt.bind(1, job_id);
        if (stmt.step() != SQLITE_ROW) return std::nullopt;
        return read_job(stmt);
    }

    std::optional<study_record> get_study_internal(std::string_view study_uid) const {
        statement stmt(db_,
                       "SELECT study_uid, patient_id, patient_name, "
                       "accession_number, modality, state, created_at, "
                       "updated_at, last_instance_at FROM studies "
                       "WHERE study_uid = ?");
        if (!stmt.ok()) return std::nullopt;
        stmt.bind(1, study_uid);
        if (stmt.step() != SQLITE_ROW) return std::nullopt;

        study_record study;
        study.study_uid = stmt.text(0);
        study.metadata.patient_id = stmt.text(1);
        study.metadata.patient_name = stmt.text(2);
        study.metadata.accession_number = stmt.text(3);
        study.metadata.modality = stmt.text(4);
        study.state = pipeline::parse_study_state(stmt.text(5))
                          .value_or(study_state::collecting);
        study.created_at = from_sqlite_timestamp(stmt.text(6));
        study.updated_at = from_sqlite_timestamp(stmt.text(7));
        study.last_instance_at = from_sqlite_timestamp(stmt.text(8));

        statement uids(db_,
                       "SELECT instance_uid FROM instances WHERE study_uid = ? "
                       "ORDER BY received_at ASC, rowid ASC");
        if (uids.ok()) {
            uids.bind(1, study_uid);
            while (uids.step() == SQLITE_ROW) {
                study.instance_uids.push_back(uids.text(0));
            }
        }
        return study;
    }

    std::optional<study_state> study_state_internal(std::string_view study_uid) const {
        statement stmt(db_, "SELECT state FROM studies WHERE study_uid = ?");
        if (!stmt.ok()) return std::nullopt;
        stmt.bind(1, study_uid);
        if (stmt.step() != SQLITE_ROW) return std::nullopt;
        return pipeline::parse_study_state(stmt.text(0));
    }

    int64_t count_instances_internal(std::string_view study_uid) const {
        statement stmt(db_, "SELECT COUNT(*) FROM instances WHERE study_uid = ?");
        if (!stmt.ok()) return 0;
        stmt.bind(1, study_uid);
        if (stmt.step() != SQLITE_ROW) return 0;
        return stmt.int64(0);
    }

    /**
     * @brief Close a ready study unless instances arrived after job creation
     */
    std::expected<finish_outcome, store_error> close_study_internal(
        const job_record& job, const std::string& now_str) {
        statement stmt(db_,
                       "UPDATE studies SET state = 'closed', updated_at = ? "
                       "WHERE study_uid = ? AND state = 'ready' AND "
                       "(SELECT COUNT(*) FROM instances WHERE study_uid = ?) <= ?");
        if (!stmt.ok()) return std::unexpected(store_error::database_error);
        stmt.bind(1, now_str)
            .bind(2, job.study_uid)
            .bind(3, job.study_uid)
            .bind(4, static_cast<int64_t>(job.instance_count));
        if (stmt.step() != SQLITE_DONE) {
            return std::unexpected(store_error::database_error);
        }

        finish_outcome outcome;
        outcome.study_closed = sqlite3_changes(db_) > 0;
        outcome.study = study_state_internal(job.study_uid).value_or(study_state::closed);
        return outcome;
    }

    /**
     * @brief Conditional update guarded by lease ownership and current state
     */
    std::expected<void, store_error> check_lease_update(int rc,
                                                        std::string_view job_id) const {
        if (rc != SQLITE_DONE) {
            return std::unexpected(store_error::database_error);
        }
        if (sqlite3_changes(db_) == 0) {
            if (!get_job_internal(job_id)) {
                return std::unexpected(store_error::not_found);
            }
            return std::unexpected(store_error::stale_state);
        }
        return {};
    }

    // =========================================================================
    // Instances
    // =========================================================================

    std::expected<insert_outcome, store_error> insert_instance(
        const instance_record& instance, const study_metadata& metadata) {
        if (instance.instance_uid.empty() || instance.series_uid.empty() ||
            instance.study_uid.empty()) {
            return std::unexpected(store_error::invalid_argument);
        }

        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        {
            auto sql = std::format(
                "INSERT OR IGNORE INTO instances ({}) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                INSTANCE_COLUMNS);
            statement stmt(db_, sql.c_str());
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, instance.instance_uid)
                .bind(2, instance.series_uid)
                .bind(3, instance.study_uid)
                .bind(4, instance.sop_class_uid)
                .bind(5, instance.modality)
                .bind(6, instance.payload_path.string())
                .bind(7, static_cast<int64_t>(instance.payload_size))
                .bind(8, to_sqlite_timestamp(instance.received_at));
            if (stmt.step() != SQLITE_DONE) {
                return std::unexpected(store_error::database_error);
            }
        }

        if (sqlite3_changes(db_) == 0) {
            if (!tx.commit()) return std::unexpected(store_error::transaction_error);
            return insert_outcome::duplicate;
        }

        {
            std::string now_str = to_sqlite_timestamp(std::chrono::system_clock::now());
            statement stmt(db_, R"(
                INSERT INTO studies (study_uid, patient_id, patient_name,
                                     accession_number, modality, state,
                                     created_at, updated_at, last_instance_at)
                VALUES (?, ?, ?, ?, ?, 'collecting', ?, ?, '')
                ON CONFLICT(study_uid) DO UPDATE SET
                    patient_id = COALESCE(NULLIF(studies.patient_id, ''), excluded.patient_id),
                    patient_name = COALESCE(NULLIF(studies.patient_name, ''), excluded.patient_name),
                    accession_number = COALESCE(NULLIF(studies.accession_number, ''), excluded.accession_number),
                    modality = COALESCE(NULLIF(studies.modality, ''), excluded.modality)
            )");
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, instance.study_uid)
                .bind(2, metadata.patient_id)
                .bind(3, metadata.patient_name)
                .bind(4, metadata.accession_number)
                .bind(5, metadata.modality.empty() ? instance.modality : metadata.modality)
                .bind(6, now_str)
                .bind(7, now_str);
            if (stmt.step() != SQLITE_DONE) {
                return std::unexpected(store_error::database_error);
            }
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);
        return insert_outcome::inserted;
    }

    std::optional<instance_record> get_instance(std::string_view instance_uid) const {
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::nullopt;
        auto sql = std::format("SELECT {} FROM instances WHERE instance_uid = ?",
                               INSTANCE_COLUMNS);
        statement stmt(db_, sql.c_str());
        if (!stmt.ok()) return std::nullopt;
        stmt.bind(1, instance_uid);
        if (stmt.step() != SQLITE_ROW) return std::nullopt;
        return read_instance(stmt);
    }

    std::vector<instance_record> get_study_instances(std::string_view study_uid) const {
        std::vector<instance_record> result;
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return result;
        auto sql = std::format(
            "SELECT {} FROM instances WHERE study_uid = ? "
            "ORDER BY series_uid ASC, received_at ASC, rowid ASC",
            INSTANCE_COLUMNS);
        statement stmt(db_, sql.c_str());
        if (!stmt.ok()) return result;
        stmt.bind(1, study_uid);
        while (stmt.step() == SQLITE_ROW) {
            result.push_back(read_instance(stmt));
        }
        return result;
    }

    std::vector<instance_record> get_job_instances(std::string_view job_id) const {
        std::vector<instance_record> result;
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return result;
        auto sql = std::format(
            "SELECT {} FROM instances WHERE instance_uid IN "
            "(SELECT instance_uid FROM job_instances WHERE job_id = ?) "
            "ORDER BY series_uid ASC, received_at ASC, rowid ASC",
            INSTANCE_COLUMNS);
        statement stmt(db_, sql.c_str());
        if (!stmt.ok()) return result;
        stmt.bind(1, job_id);
        while (stmt.step() == SQLITE_ROW) {
            result.push_back(read_instance(stmt));
        }
        return result;
    }

    // =========================================================================
    // Studies
    // =========================================================================

    std::expected<study_state, store_error> touch_study(std::string_view study_uid,
                                                        time_point received_at) {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        auto previous = study_state_internal(study_uid);
        if (!previous) return std::unexpected(store_error::not_found);

        statement stmt(db_,
                       "UPDATE studies SET state = 'collecting', "
                       "last_instance_at = MAX(last_instance_at, ?), "
                       "updated_at = ? WHERE study_uid = ?");
        if (!stmt.ok()) return std::unexpected(store_error::database_error);
        stmt.bind(1, to_sqlite_timestamp(received_at))
            .bind(2, to_sqlite_timestamp(std::chrono::system_clock::now()))
            .bind(3, study_uid);
        if (stmt.step() != SQLITE_DONE) {
            return std::unexpected(store_error::database_error);
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);
        return *previous;
    }

    std::expected<void, store_error> transition_study(std::string_view study_uid,
                                                      study_state from,
                                                      study_state to) {
        if (!pipeline::is_valid_transition(from, to)) {
            return std::unexpected(store_error::invalid_transition);
        }

        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        statement stmt(db_,
                       "UPDATE studies SET state = ?, updated_at = ? "
                       "WHERE study_uid = ? AND state = ?");
        if (!stmt.ok()) return std::unexpected(store_error::database_error);
        stmt.bind(1, pipeline::to_string(to))
            .bind(2, to_sqlite_timestamp(std::chrono::system_clock::now()))
            .bind(3, study_uid)
            .bind(4, pipeline::to_string(from));
        if (stmt.step() != SQLITE_DONE) {
            return std::unexpected(store_error::database_error);
        }
        if (sqlite3_changes(db_) == 0) {
            if (!study_state_internal(study_uid)) {
                return std::unexpected(store_error::not_found);
            }
            return std::unexpected(store_error::stale_state);
        }
        return {};
    }

    std::optional<study_record> get_study(std::string_view study_uid) const {
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::nullopt;
        return get_study_internal(study_uid);
    }

    std::vector<std::string> query_uids(const char* sql,
                                        std::optional<std::string_view> param) const {
        std::vector<std::string> result;
        statement stmt(db_, sql);
        if (!stmt.ok()) return result;
        if (param) {
            stmt.bind(1, *param);
        }
        while (stmt.step() == SQLITE_ROW) {
            result.push_back(stmt.text(0));
        }
        return result;
    }

    std::vector<study_record> get_studies_in_state(study_state state) const {
        std::vector<study_record> result;
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return result;
        auto uids = query_uids(
            "SELECT study_uid FROM studies WHERE state = ? ORDER BY last_instance_at",
            std::string_view(pipeline::to_string(state)));
        for (const auto& uid : uids) {
            if (auto study = get_study_internal(uid)) {
                result.push_back(std::move(*study));
            }
        }
        return result;
    }

    std::vector<std::string> get_studies_with_unassembled_instances() const {
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return {};
        return query_uids(
            "SELECT s.study_uid FROM studies s "
            "JOIN instances i ON i.study_uid = s.study_uid "
            "GROUP BY s.study_uid "
            "HAVING MAX(i.received_at) > s.last_instance_at",
            std::nullopt);
    }

    std::vector<std::string> get_ready_studies_without_job() const {
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return {};
        return query_uids(
            "SELECT s.study_uid FROM studies s WHERE s.state = 'ready' AND "
            "NOT EXISTS (SELECT 1 FROM jobs j WHERE j.study_uid = s.study_uid "
            "AND j.state NOT IN ('done', 'failed')) "
            "ORDER BY s.updated_at",
            std::nullopt);
    }

    // =========================================================================
    // Jobs
    // =========================================================================

    std::expected<job_record, store_error> create_job(std::string_view study_uid) {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        if (!study_state_internal(study_uid)) {
            return std::unexpected(store_error::not_found);
        }

        std::string job_id = generate_id("job");
        auto now = std::chrono::system_clock::now();
        std::string now_str = to_sqlite_timestamp(now);
        auto instance_count = count_instances_internal(study_uid);

        {
            statement stmt(db_, R"(
                INSERT INTO jobs (job_id, study_uid, state, attempt_count,
                                  instance_count, next_attempt_at,
                                  created_at, updated_at)
                SELECT ?, ?, 'received', 0, ?, ?, ?, ?
                WHERE NOT EXISTS (
                    SELECT 1 FROM jobs
                    WHERE study_uid = ? AND state NOT IN ('done', 'failed'))
            )");
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, job_id)
                .bind(2, study_uid)
                .bind(3, instance_count)
                .bind(4, now_str)
                .bind(5, now_str)
                .bind(6, now_str)
                .bind(7, study_uid);
            int rc = stmt.step();
            if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
                return std::unexpected(store_error::active_job_exists);
            }
            if (rc != SQLITE_DONE) {
                return std::unexpected(store_error::database_error);
            }
        }

        if (sqlite3_changes(db_) == 0) {
            return std::unexpected(store_error::active_job_exists);
        }

        {
            statement stmt(db_,
                           "INSERT INTO job_instances (job_id, instance_uid) "
                           "SELECT ?, instance_uid FROM instances WHERE study_uid = ?");
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, job_id).bind(2, study_uid);
            if (stmt.step() != SQLITE_DONE) {
                return std::unexpected(store_error::database_error);
            }
        }

        if (!insert_event(job_id, std::nullopt, job_state::received, 0,
                          std::format("created with {} instances", instance_count),
                          now_str)) {
            return std::unexpected(store_error::database_error);
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);

        auto job = get_job_internal(job_id);
        if (!job) return std::unexpected(store_error::database_error);
        return *job;
    }

    std::optional<job_record> get_job(std::string_view job_id) const {
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::nullopt;
        return get_job_internal(job_id);
    }

    std::optional<job_record> get_active_job(std::string_view study_uid) const {
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::nullopt;
        auto sql = std::format(
            "SELECT {} FROM jobs WHERE study_uid = ? "
            "AND state NOT IN ('done', 'failed')",
            JOB_COLUMNS);
        statement stmt(db_, sql.c_str());
        if (!stmt.ok()) return std::nullopt;
        stmt.bind(1, study_uid);
        if (stmt.step() != SQLITE_ROW) return std::nullopt;
        return read_job(stmt);
    }

    std::vector<job_record> get_jobs_for_study(std::string_view study_uid) const {
        std::vector<job_record> result;
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return result;
        auto sql = std::format(
            "SELECT {} FROM jobs WHERE study_uid = ? ORDER BY created_at, rowid",
            JOB_COLUMNS);
        statement stmt(db_, sql.c_str());
        if (!stmt.ok()) return result;
        stmt.bind(1, study_uid);
        while (stmt.step() == SQLITE_ROW) {
            result.push_back(read_job(stmt));
        }
        return result;
    }

    std::vector<job_event> get_job_history(std::string_view job_id) const {
        std::vector<job_event> result;
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return result;
        statement stmt(db_,
                       "SELECT job_id, from_state, to_state, attempt, detail, at "
                       "FROM job_events WHERE job_id = ? ORDER BY id ASC");
        if (!stmt.ok()) return result;
        stmt.bind(1, job_id);
        while (stmt.step() == SQLITE_ROW) {
            job_event event;
            event.job_id = stmt.text(0);
            if (!stmt.is_null(1)) {
                event.from_state = pipeline::parse_job_state(stmt.text(1));
            }
            event.to_state =
                pipeline::parse_job_state(stmt.text(2)).value_or(job_state::failed);
            event.attempt = static_cast<int>(stmt.int64(3));
            event.detail = stmt.text(4);
            event.at = from_sqlite_timestamp(stmt.text(5));
            result.push_back(std::move(event));
        }
        return result;
    }

    std::expected<void, store_error> admit_job(std::string_view job_id) {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        std::string now_str = to_sqlite_timestamp(std::chrono::system_clock::now());
        statement stmt(db_,
                       "UPDATE jobs SET state = 'queued', updated_at = ? "
                       "WHERE job_id = ? AND state = 'received'");
        if (!stmt.ok()) return std::unexpected(store_error::database_error);
        stmt.bind(1, now_str).bind(2, job_id);
        if (auto r = check_lease_update(stmt.step(), job_id); !r) {
            return r;
        }

        if (!insert_event(job_id, job_state::received, job_state::queued, 0,
                          "admitted to work queue", now_str)) {
            return std::unexpected(store_error::database_error);
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);
        return {};
    }

    std::expected<job_record, store_error> claim_job(
        std::string_view job_id, std::string_view owner,
        std::chrono::milliseconds lease_duration) {
        if (owner.empty()) return std::unexpected(store_error::invalid_argument);

        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        auto job = get_job_internal(job_id);
        if (!job) return std::unexpected(store_error::not_found);

        auto now = std::chrono::system_clock::now();
        std::string now_str = to_sqlite_timestamp(now);
        bool due = job->next_attempt_at <= now;

        job_state target = job->state;
        std::string detail;
        if (job->state == job_state::queued && due) {
            target = job_state::analyzing;
            detail = std::format("claimed by {}", owner);
        } else if (pipeline::is_in_flight(job->state) && due &&
                   (job->lease_owner.empty() ||
                    (job->lease_expires_at && *job->lease_expires_at <= now))) {
            detail = job->lease_owner.empty()
                         ? std::format("resumed by {}", owner)
                         : std::format("lease of {} expired; recovered by {}",
                                       job->lease_owner, owner);
        } else {
            return std::unexpected(store_error::stale_state);
        }

        statement stmt(db_,
                       "UPDATE jobs SET state = ?, lease_owner = ?, "
                       "lease_expires_at = ?, "
                       "lease_generation = lease_generation + 1, updated_at = ? "
                       "WHERE job_id = ? AND lease_generation = ? AND state = ?");
        if (!stmt.ok()) return std::unexpected(store_error::database_error);
        stmt.bind(1, pipeline::to_string(target))
            .bind(2, owner)
            .bind(3, to_sqlite_timestamp(now + lease_duration))
            .bind(4, now_str)
            .bind(5, job_id)
            .bind(6, job->lease_generation)
            .bind(7, pipeline::to_string(job->state));
        if (auto r = check_lease_update(stmt.step(), job_id); !r) {
            return std::unexpected(r.error());
        }

        if (!insert_event(job_id, job->state, target, job->attempt_count, detail,
                          now_str)) {
            return std::unexpected(store_error::database_error);
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);

        auto claimed = get_job_internal(job_id);
        if (!claimed) return std::unexpected(store_error::database_error);
        return *claimed;
    }

    std::expected<void, store_error> renew_lease(const lease_token& lease,
                                                 std::chrono::milliseconds duration) {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        auto now = std::chrono::system_clock::now();
        statement stmt(db_,
                       "UPDATE jobs SET lease_expires_at = ?, updated_at = ? "
                       "WHERE job_id = ? AND lease_generation = ? AND lease_owner = ?");
        if (!stmt.ok()) return std::unexpected(store_error::database_error);
        stmt.bind(1, to_sqlite_timestamp(now + duration))
            .bind(2, to_sqlite_timestamp(now))
            .bind(3, lease.job_id)
            .bind(4, lease.generation)
            .bind(5, lease.owner);
        return check_lease_update(stmt.step(), lease.job_id);
    }

    /**
     * @brief Advance an in-flight job to the next stage under its lease
     */
    std::expected<void, store_error> advance_stage(const lease_token& lease,
                                                   job_state from, job_state to,
                                                   std::chrono::milliseconds duration,
                                                   const std::string& now_str,
                                                   time_point now) {
        statement stmt(db_,
                       "UPDATE jobs SET state = ?, lease_expires_at = ?, updated_at = ? "
                       "WHERE job_id = ? AND lease_generation = ? AND "
                       "lease_owner = ? AND state = ?");
        if (!stmt.ok()) return std::unexpected(store_error::database_error);
        stmt.bind(1, pipeline::to_string(to))
            .bind(2, to_sqlite_timestamp(now + duration))
            .bind(3, now_str)
            .bind(4, lease.job_id)
            .bind(5, lease.generation)
            .bind(6, lease.owner)
            .bind(7, pipeline::to_string(from));
        return check_lease_update(stmt.step(), lease.job_id);
    }

    std::expected<void, store_error> complete_analysis(
        const lease_token& lease, const std::vector<finding>& findings,
        std::chrono::milliseconds duration) {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        auto now = std::chrono::system_clock::now();
        std::string now_str = to_sqlite_timestamp(now);

        if (auto r = advance_stage(lease, job_state::analyzing, job_state::reporting,
                                   duration, now_str, now);
            !r) {
            return r;
        }

        int ordinal = 0;
        for (const auto& item : findings) {
            statement stmt(db_, R"(
                INSERT INTO findings (job_id, ordinal, category, confidence,
                                      x, y, z, width, height, depth,
                                      severity, description, measurements)
                VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            )");
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, lease.job_id)
                .bind(2, ordinal++)
                .bind(3, item.category)
                .bind(4, item.confidence)
                .bind(5, item.location.x)
                .bind(6, item.location.y)
                .bind(7, item.location.z)
                .bind(8, item.location.width)
                .bind(9, item.location.height)
                .bind(10, item.location.depth)
                .bind(11, pipeline::to_string(item.level))
                .bind(12, item.description)
                .bind(13, encode_measurements(item.measurements));
            int rc = stmt.step();
            if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
                return std::unexpected(store_error::invalid_argument);
            }
            if (rc != SQLITE_DONE) {
                return std::unexpected(store_error::database_error);
            }
        }

        auto job = get_job_internal(lease.job_id);
        int attempt = job ? job->attempt_count : 0;
        if (!insert_event(lease.job_id, job_state::analyzing, job_state::reporting,
                          attempt, std::format("{} findings", findings.size()),
                          now_str)) {
            return std::unexpected(store_error::database_error);
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);
        return {};
    }

    std::vector<finding> get_findings(std::string_view job_id) const {
        std::vector<finding> result;
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return result;
        statement stmt(db_,
                       "SELECT category, confidence, x, y, z, width, height, "
                       "depth, severity, description, measurements "
                       "FROM findings WHERE job_id = ? ORDER BY ordinal ASC");
        if (!stmt.ok()) return result;
        stmt.bind(1, job_id);
        while (stmt.step() == SQLITE_ROW) {
            finding item;
            item.category = stmt.text(0);
            item.confidence = stmt.real(1);
            item.location = {stmt.real(2), stmt.real(3), stmt.real(4),
                             stmt.real(5), stmt.real(6), stmt.real(7)};
            item.level = pipeline::parse_severity(stmt.text(8))
                             .value_or(pipeline::severity::low);
            item.description = stmt.text(9);
            item.measurements = decode_measurements(stmt.text(10));
            result.push_back(std::move(item));
        }
        return result;
    }

    std::expected<void, store_error> complete_report(
        const lease_token& lease, const report_record& report,
        std::chrono::milliseconds duration) {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        auto now = std::chrono::system_clock::now();
        std::string now_str = to_sqlite_timestamp(now);

        if (auto r = advance_stage(lease, job_state::reporting, job_state::delivering,
                                   duration, now_str, now);
            !r) {
            return r;
        }

        auto job = get_job_internal(lease.job_id);
        if (!job) return std::unexpected(store_error::not_found);

        std::string report_id =
            report.report_id.empty() ? report_id_for(lease.job_id) : report.report_id;

        {
            statement stmt(db_, R"(
                INSERT INTO reports (report_id, job_id, study_uid, format,
                                     template_version, content_type, payload,
                                     payload_size, finding_count,
                                     delivery_state, created_at)
                VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, 'pending', ?)
            )");
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, report_id)
                .bind(2, lease.job_id)
                .bind(3, job->study_uid)
                .bind(4, report.format)
                .bind(5, report.template_version)
                .bind(6, report.content_type)
                .bind_blob(7, report.payload)
                .bind(8, static_cast<int64_t>(report.payload.size()))
                .bind(9, static_cast<int64_t>(report.finding_count))
                .bind(10, now_str);
            int rc = stmt.step();
            if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
                return std::unexpected(store_error::duplicate_report);
            }
            if (rc != SQLITE_DONE) {
                return std::unexpected(store_error::database_error);
            }
        }

        if (!insert_event(lease.job_id, job_state::reporting, job_state::delivering,
                          job->attempt_count,
                          std::format("report {} ({})", report_id, report.format),
                          now_str)) {
            return std::unexpected(store_error::database_error);
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);
        return {};
    }

    std::expected<void, store_error> record_delivery_response(
        std::string_view report_id, std::string_view response) {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        statement stmt(db_,
                       "UPDATE reports SET archive_response = ? WHERE report_id = ?");
        if (!stmt.ok()) return std::unexpected(store_error::database_error);
        stmt.bind(1, response).bind(2, report_id);
        if (stmt.step() != SQLITE_DONE) {
            return std::unexpected(store_error::database_error);
        }
        if (sqlite3_changes(db_) == 0) {
            return std::unexpected(store_error::not_found);
        }
        return {};
    }

    std::expected<finish_outcome, store_error> complete_job(
        const lease_token& lease, std::string_view archive_response) {
        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        std::string now_str = to_sqlite_timestamp(std::chrono::system_clock::now());

        {
            statement stmt(db_,
                           "UPDATE jobs SET state = 'done', lease_owner = NULL, "
                           "lease_expires_at = NULL, finished_at = ?, updated_at = ? "
                           "WHERE job_id = ? AND lease_generation = ? AND "
                           "lease_owner = ? AND state = 'delivering'");
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, now_str)
                .bind(2, now_str)
                .bind(3, lease.job_id)
                .bind(4, lease.generation)
                .bind(5, lease.owner);
            if (auto r = check_lease_update(stmt.step(), lease.job_id); !r) {
                return std::unexpected(r.error());
            }
        }

        {
            statement stmt(db_,
                           "UPDATE reports SET delivery_state = 'sent', sent_at = ?, "
                           "archive_response = ? "
                           "WHERE job_id = ? AND delivery_state = 'pending'");
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, now_str).bind(2, archive_response).bind(3, lease.job_id);
            if (stmt.step() != SQLITE_DONE) {
                return std::unexpected(store_error::database_error);
            }
        }

        auto job = get_job_internal(lease.job_id);
        if (!job) return std::unexpected(store_error::not_found);

        auto outcome = close_study_internal(*job, now_str);
        if (!outcome) return outcome;

        if (!insert_event(lease.job_id, job_state::delivering, job_state::done,
                          job->attempt_count, "accepted by archive", now_str)) {
            return std::unexpected(store_error::database_error);
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);
        return outcome;
    }

    std::expected<void, store_error> schedule_retry(const lease_token& lease,
                                                    job_state from, job_state to,
                                                    int attempt_count,
                                                    std::string_view error,
                                                    time_point next_attempt_at) {
        bool retry_edge = (from == job_state::analyzing && to == job_state::queued) ||
                          (from == job_state::delivering && to == job_state::delivering);
        if (!retry_edge || !pipeline::is_valid_transition(from, to)) {
            return std::unexpected(store_error::invalid_transition);
        }

        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        std::string now_str = to_sqlite_timestamp(std::chrono::system_clock::now());
        std::string next_str = to_sqlite_timestamp(next_attempt_at);

        statement stmt(db_,
                       "UPDATE jobs SET state = ?, attempt_count = ?, last_error = ?, "
                       "error_stage = ?, lease_owner = NULL, lease_expires_at = NULL, "
                       "next_attempt_at = ?, updated_at = ? "
                       "WHERE job_id = ? AND lease_generation = ? AND "
                       "lease_owner = ? AND state = ?");
        if (!stmt.ok()) return std::unexpected(store_error::database_error);
        stmt.bind(1, pipeline::to_string(to))
            .bind(2, attempt_count)
            .bind(3, error)
            .bind(4, pipeline::to_string(from))
            .bind(5, next_str)
            .bind(6, now_str)
            .bind(7, lease.job_id)
            .bind(8, lease.generation)
            .bind(9, lease.owner)
            .bind(10, pipeline::to_string(from));
        if (auto r = check_lease_update(stmt.step(), lease.job_id); !r) {
            return r;
        }

        if (!insert_event(lease.job_id, from, to, attempt_count,
                          std::format("retry at {}: {}", next_str, error), now_str)) {
            return std::unexpected(store_error::database_error);
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);
        return {};
    }

    std::expected<finish_outcome, store_error> fail_job(const lease_token& lease,
                                                        job_state from,
                                                        int attempt_count,
                                                        std::string_view error) {
        if (!pipeline::is_in_flight(from) ||
            !pipeline::is_valid_transition(from, job_state::failed)) {
            return std::unexpected(store_error::invalid_transition);
        }

        std::unique_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::unexpected(store_error::not_open);

        transaction tx(db_);
        if (!tx.active()) return std::unexpected(store_error::transaction_error);

        std::string now_str = to_sqlite_timestamp(std::chrono::system_clock::now());

        {
            statement stmt(db_,
                           "UPDATE jobs SET state = 'failed', attempt_count = ?, "
                           "last_error = ?, error_stage = ?, lease_owner = NULL, "
                           "lease_expires_at = NULL, finished_at = ?, updated_at = ? "
                           "WHERE job_id = ? AND lease_generation = ? AND "
                           "lease_owner = ? AND state = ?");
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, attempt_count)
                .bind(2, error)
                .bind(3, pipeline::to_string(from))
                .bind(4, now_str)
                .bind(5, now_str)
                .bind(6, lease.job_id)
                .bind(7, lease.generation)
                .bind(8, lease.owner)
                .bind(9, pipeline::to_string(from));
            if (auto r = check_lease_update(stmt.step(), lease.job_id); !r) {
                return std::unexpected(r.error());
            }
        }

        {
            statement stmt(db_,
                           "UPDATE reports SET delivery_state = 'failed' "
                           "WHERE job_id = ? AND delivery_state = 'pending'");
            if (!stmt.ok()) return std::unexpected(store_error::database_error);
            stmt.bind(1, lease.job_id);
            if (stmt.step() != SQLITE_DONE) {
                return std::unexpected(store_error::database_error);
            }
        }

        auto job = get_job_internal(lease.job_id);
        if (!job) return std::unexpected(store_error::not_found);

        auto outcome = close_study_internal(*job, now_str);
        if (!outcome) return outcome;

        if (!insert_event(lease.job_id, from, job_state::failed, attempt_count,
                          std::string(error), now_str)) {
            return std::unexpected(store_error::database_error);
        }

        if (!tx.commit()) return std::unexpected(store_error::transaction_error);
        return outcome;
    }

    std::vector<dispatch_candidate> get_dispatchable_jobs(time_point now,
                                                          size_t limit) const {
        std::vector<dispatch_candidate> result;
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return result;

        statement stmt(db_, R"(
            SELECT job_id, study_uid, state, lease_owner FROM jobs
            WHERE state = 'received'
               OR (state = 'queued' AND next_attempt_at <= ?1)
               OR (state IN ('analyzing', 'reporting', 'delivering')
                   AND next_attempt_at <= ?1
                   AND (lease_owner IS NULL OR lease_expires_at <= ?1))
            ORDER BY next_attempt_at ASC, created_at ASC, rowid ASC
            LIMIT ?2
        )");
        if (!stmt.ok()) return result;
        stmt.bind(1, to_sqlite_timestamp(now)).bind(2, static_cast<int64_t>(limit));

        while (stmt.step() == SQLITE_ROW) {
            dispatch_candidate candidate;
            candidate.job_id = stmt.text(0);
            candidate.study_uid = stmt.text(1);
            candidate.state =
                pipeline::parse_job_state(stmt.text(2)).value_or(job_state::failed);
            candidate.lease_expired =
                pipeline::is_in_flight(candidate.state) && !stmt.is_null(3);
            result.push_back(std::move(candidate));
        }
        return result;
    }

    // =========================================================================
    // Reports and observability
    // =========================================================================

    std::optional<report_record> get_report_for_job(std::string_view job_id) const {
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return std::nullopt;

        statement stmt(db_,
                       "SELECT report_id, job_id, study_uid, format, "
                       "template_version, content_type, payload, finding_count, "
                       "delivery_state, archive_response, sent_at, created_at "
                       "FROM reports WHERE job_id = ?");
        if (!stmt.ok()) return std::nullopt;
        stmt.bind(1, job_id);
        if (stmt.step() != SQLITE_ROW) return std::nullopt;

        report_record report;
        report.report_id = stmt.text(0);
        report.job_id = stmt.text(1);
        report.study_uid = stmt.text(2);
        report.format = stmt.text(3);
        report.template_version = stmt.text(4);
        report.content_type = stmt.text(5);
        report.payload = stmt.blob(6);
        report.finding_count = static_cast<size_t>(stmt.int64(7));
        report.delivery = pipeline::parse_delivery_state(stmt.text(8))
                              .value_or(pipeline::delivery_state::pending);
        report.archive_response = stmt.text(9);
        if (!stmt.is_null(10)) {
            report.sent_at = from_sqlite_timestamp(stmt.text(10));
        }
        report.created_at = from_sqlite_timestamp(stmt.text(11));
        return report;
    }

    pipeline::job_state_counts count_jobs_by_state() const {
        pipeline::job_state_counts counts;
        for (auto state : pipeline::all_job_states) {
            counts[state] = 0;
        }

        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return counts;

        statement stmt(db_, "SELECT state, COUNT(*) FROM jobs GROUP BY state");
        if (!stmt.ok()) return counts;
        while (stmt.step() == SQLITE_ROW) {
            if (auto state = pipeline::parse_job_state(stmt.text(0))) {
                counts[*state] = static_cast<size_t>(stmt.int64(1));
            }
        }
        return counts;
    }

    std::vector<pipeline::failure_summary> get_recent_failures(size_t limit) const {
        std::vector<pipeline::failure_summary> result;
        std::shared_lock<std::shared_mutex> lock(db_mutex_);
        if (!db_) return result;

        statement stmt(db_,
                       "SELECT job_id, study_uid, error_stage, attempt_count, "
                       "last_error, finished_at FROM jobs WHERE state = 'failed' "
                       "ORDER BY finished_at DESC, rowid DESC LIMIT ?");
        if (!stmt.ok()) return result;
        stmt.bind(1, static_cast<int64_t>(limit));
        while (stmt.step() == SQLITE_ROW) {
            pipeline::failure_summary summary;
            summary.job_id = stmt.text(0);
            summary.study_uid = stmt.text(1);
            if (!stmt.is_null(2)) {
                summary.failed_stage = pipeline::parse_job_state(stmt.text(2));
            }
            summary.attempt_count = static_cast<int>(stmt.int64(3));
            summary.reason = stmt.text(4);
            summary.failed_at = from_sqlite_timestamp(stmt.text(5));
            result.push_back(std::move(summary));
        }
        return result;
    }
};

// =============================================================================
// pipeline_store public interface
// =============================================================================

pipeline_store::pipeline_store(const store_config& config)
    : pimpl_(std::make_unique<impl>(config)) {}

pipeline_store::~pipeline_store() = default;

pipeline_store::pipeline_store(pipeline_store&&) noexcept = default;
pipeline_store& pipeline_store::operator=(pipeline_store&&) noexcept = default;

std::expected<void, store_error> pipeline_store::open() { return pimpl_->open(); }

void pipeline_store::close() { pimpl_->close(); }

bool pipeline_store::is_open() const noexcept {
    std::shared_lock<std::shared_mutex> lock(pimpl_->db_mutex_);
    return pimpl_->db_ != nullptr;
}

const store_config& pipeline_store::config() const noexcept {
    return pimpl_->config_;
}

std::expected<insert_outcome, store_error> pipeline_store::insert_instance(
    const instance_record& instance, const study_metadata& metadata) {
    return pimpl_->insert_instance(instance, metadata);
}

std::optional<instance_record> pipeline_store::get_instance(
    std::string_view instance_uid) const {
    return pimpl_->get_instance(instance_uid);
}

std::vector<instance_record> pipeline_store::get_study_instances(
    std::string_view study_uid) const {
    return pimpl_->get_study_instances(study_uid);
}

std::vector<instance_record> pipeline_store::get_job_instances(
    std::string_view job_id) const {
    return pimpl_->get_job_instances(job_id);
}

std::expected<study_state, store_error> pipeline_store::touch_study(
    std::string_view study_uid, time_point received_at) {
    return pimpl_->touch_study(study_uid, received_at);
}

std::expected<void, store_error> pipeline_store::transition_study(
    std::string_view study_uid, study_state from, study_state to) {
    return pimpl_->transition_study(study_uid, from, to);
}

std::optional<study_record> pipeline_store::get_study(
    std::string_view study_uid) const {
    return pimpl_->get_study(study_uid);
}

std::vector<study_record> pipeline_store::get_studies_in_state(
    study_state state) const {
    return pimpl_->get_studies_in_state(state);
}

std::vector<std::string> pipeline_store::get_studies_with_unassembled_instances()
    const {
    return pimpl_->get_studies_with_unassembled_instances();
}

std::vector<std::string> pipeline_store::get_ready_studies_without_job() const {
    return pimpl_->get_ready_studies_without_job();
}

std::expected<job_record, store_error> pipeline_store::create_job(
    std::string_view study_uid) {
    return pimpl_->create_job(study_uid);
}

std::optional<job_record> pipeline_store::get_job(std::string_view job_id) const {
    return pimpl_->get_job(job_id);
}

std::optional<job_record> pipeline_store::get_active_job(
    std::string_view study_uid) const {
    return pimpl_->get_active_job(study_uid);
}

std::vector<job_record> pipeline_store::get_jobs_for_study(
    std::string_view study_uid) const {
    return pimpl_->get_jobs_for_study(study_uid);
}

std::vector<job_event> pipeline_store::get_job_history(
    std::string_view job_id) const {
    return pimpl_->get_job_history(job_id);
}

std::expected<void, store_error> pipeline_store::admit_job(std::string_view job_id) {
    return pimpl_->admit_job(job_id);
}

std::expected<job_record, store_error> pipeline_store::claim_job(
    std::string_view job_id, std::string_view owner,
    std::chrono::milliseconds lease_duration) {
    return pimpl_->claim_job(job_id, owner, lease_duration);
}

std::expected<void, store_error> pipeline_store::renew_lease(
    const lease_token& lease, std::chrono::milliseconds lease_duration) {
    return pimpl_->renew_lease(lease, lease_duration);
}

std::expected<void, store_error> pipeline_store::complete_analysis(
    const lease_token& lease, const std::vector<finding>& findings,
    std::chrono::milliseconds lease_duration) {
    return pimpl_->complete_analysis(lease, findings, lease_duration);
}

std::vector<finding> pipeline_store::get_findings(std::string_view job_id) const {
    return pimpl_->get_findings(job_id);
}

std::expected<void, store_error> pipeline_store::complete_report(
    const lease_token& lease, const report_record& report,
    std::chrono::milliseconds lease_duration) {
    return pimpl_->complete_report(lease, report, lease_duration);
}

std::expected<void, store_error> pipeline_store::record_delivery_response(
    std::string_view report_id, std::string_view response) {
    return pimpl_->record_delivery_response(report_id, response);
}

std::expected<finish_outcome, store_error> pipeline_store::complete_job(
    const lease_token& lease, std::string_view archive_response) {
    return pimpl_->complete_job(lease, archive_response);
}

std::expected<void, store_error> pipeline_store::schedule_retry(
    const lease_token& lease, job_state from, job_state to, int attempt_count,
    std::string_view error, time_point next_attempt_at) {
    return pimpl_->schedule_retry(lease, from, to, attempt_count, error,
                                  next_attempt_at);
}

std::expected<finish_outcome, store_error> pipeline_store::fail_job(
    const lease_token& lease, job_state from, int attempt_count,
    std::string_view error) {
    return pimpl_->fail_job(lease, from, attempt_count, error);
}

std::vector<dispatch_candidate> pipeline_store::get_dispatchable_jobs(
    time_point now, std::size_t limit) const {
    return pimpl_->get_dispatchable_jobs(now, limit);
}

std::optional<report_record> pipeline_store::get_report_for_job(
    std::string_view job_id) const {
    return pimpl_->get_report_for_job(job_id);
}

pipeline::job_state_counts pipeline_store::count_jobs_by_state() const {
    return pimpl_->count_jobs_by_state();
}

std::vector<pipeline::failure_summary> pipeline_store::get_recent_failures(
    std::size_t limit) const {
    return pimpl_->get_recent_failures(limit);
}

}  // namespace aipacs::storage
