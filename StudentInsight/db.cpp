/*
-------------------------------------------------------------------------------
 db.cpp - SQLite persistence layer for StudentInsight
-------------------------------------------------------------------------------
Purpose
  - Implements all database I/O for students, academic records and behavior
    (wellbeing check-in) records using SQLite3.
  - Exposes small, purpose-specific functions called by SqliteRecordStore and
    the console.

Design notes
  - Each db_* function returns a bool for success/failure.
  - Foreign keys are enabled per-connection (PRAGMA foreign_keys=ON), so a
    record for an unknown student is rejected by the database.
  - Write ops use prepared statements with bound parameters to avoid SQL injection
    and handle quoting safely.
  - Reads that stream many rows use sqlite3_prepare_v2 / sqlite3_step loops.
  - text_feedback is the only nullable column; it maps to std::optional.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include "errors.hpp"
#include "log.hpp"

// Small helper to run a raw SQL string with sqlite3_exec and report errors.
static bool exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) { log_error(std::string("SQL error: ") + err); sqlite3_free(err); }
        return false;
    }
    return true;
}

static std::string column_string(sqlite3_stmt* st, int col) {
    const unsigned char* p = sqlite3_column_text(st, col);
    return p ? reinterpret_cast<const char*>(p) : std::string();
}

// Binds recorded_at, or NULL so COALESCE falls back to CURRENT_TIMESTAMP.
static void bind_timestamp(sqlite3_stmt* st, int idx, const std::string& recorded_at) {
    if (recorded_at.empty()) sqlite3_bind_null(st, idx);
    else sqlite3_bind_text(st, idx, recorded_at.c_str(), -1, SQLITE_TRANSIENT);
}

// Open (or create) the SQLite database file at `path` and enable FK constraints
// for this connection. Returns false if the DB cannot be opened.
bool db_open(sqlite3*& db, const std::string& path) {
    db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        log_error(std::string("Failed to open DB: ") + sqlite3_errmsg(db));
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    // Enforce FK constraints for this connection
    return exec_sql(db, "PRAGMA foreign_keys = ON;");
}

// Close the database handle if non-null.
void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

// Create tables if they don't exist yet and seed a demo cohort the first
// time the app runs. Safe to call on every startup.
bool db_init_and_seed(sqlite3* db, bool seed_demo) {
    // 1) Create tables (idempotent).
    const char* ddl =
        "PRAGMA foreign_keys = ON;"

        "CREATE TABLE IF NOT EXISTS students ("
        "  student_id  TEXT PRIMARY KEY,"
        "  name        TEXT NOT NULL,"
        "  email       TEXT NOT NULL DEFAULT '',"
        "  role        TEXT NOT NULL DEFAULT 'student',"
        "  department  TEXT NOT NULL DEFAULT ''"
        ");"

        "CREATE TABLE IF NOT EXISTS academic_records ("
        "  id               INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  student_id       TEXT NOT NULL,"
        "  marks            REAL NOT NULL,"
        "  attendance       REAL NOT NULL,"
        "  assignment_score REAL NOT NULL,"
        "  recorded_at      TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,"
        "  FOREIGN KEY (student_id) REFERENCES students(student_id) ON DELETE CASCADE"
        ");"

        "CREATE TABLE IF NOT EXISTS behavior_records ("
        "  id            INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  student_id    TEXT NOT NULL,"
        "  mood_score    INTEGER NOT NULL CHECK (mood_score BETWEEN 1 AND 5),"
        "  sleep_hours   REAL NOT NULL,"
        "  study_hours   REAL NOT NULL,"
        "  text_feedback TEXT,"
        "  recorded_at   TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,"
        "  FOREIGN KEY (student_id) REFERENCES students(student_id) ON DELETE CASCADE"
        ");"

        "CREATE INDEX IF NOT EXISTS idx_academic_student ON academic_records(student_id);"
        "CREATE INDEX IF NOT EXISTS idx_behavior_student ON behavior_records(student_id);";
    if (!exec_sql(db, ddl)) return false;
    if (!seed_demo) return true;

    // 2) Seed only when tables are empty. A fast existence check per table.
    auto table_empty = [&](const char* table)->bool {
        sqlite3_stmt* st = nullptr;
        std::string q = std::string("SELECT 1 FROM ") + table + " LIMIT 1;";
        bool empty = true;
        if (sqlite3_prepare_v2(db, q.c_str(), -1, &st, nullptr) == SQLITE_OK) {
            if (sqlite3_step(st) == SQLITE_ROW) empty = false;
        }
        sqlite3_finalize(st);
        return empty;
        };

    if (table_empty("students")) {
        const char* seed_students =
            "INSERT INTO students(student_id,name,email,role,department) VALUES"
            "('S001','Ava Patel','ava@school.test','student','Computer Science'),"
            "('S002','Leo Grant','leo@school.test','student','Computer Science'),"
            "('S003','Mia Chen','mia@school.test','student','Computer Science'),"
            "('S004','Noah Reyes','noah@school.test','student','Mechanical'),"
            "('S005','Zoe Adams','zoe@school.test','student','Mechanical'),"
            "('S006','Omar Haddad','omar@school.test','student','Mechanical'),"
            "('S007','Lily Moore','lily@school.test','student','Business'),"
            "('S008','Ethan Brooks','ethan@school.test','student','Business'),"
            "('S009','Sara Lind','sara@school.test','student','Business'),"
            "('S010','Ravi Nair','ravi@school.test','student','Computer Science'),"
            "('S011','Emma Stone','emma@school.test','student','Business'),"
            "('S012','Jack Olsen','jack@school.test','student','Mechanical'),"
            "('T001','Grace King','grace@school.test','teacher','Computer Science'),"
            "('C001','Paul Ray','paul@school.test','counselor','');";
        if (!exec_sql(db, seed_students)) return false;
    }

    if (table_empty("academic_records")) {
        const char* seed_academics =
            "INSERT INTO academic_records(student_id,marks,attendance,assignment_score,recorded_at) VALUES"
            "('S001',88,95,90,'2026-01-15 09:00:00'),('S001',92,93,94,'2026-02-15 09:00:00'),"
            "('S002',72,85,75,'2026-01-15 09:00:00'),('S002',68,80,70,'2026-02-15 09:00:00'),"
            "('S003',45,62,50,'2026-01-15 09:00:00'),('S003',40,58,42,'2026-02-15 09:00:00'),"
            "('S004',81,90,84,'2026-01-15 09:00:00'),('S004',85,92,88,'2026-02-15 09:00:00'),"
            "('S005',58,70,60,'2026-01-15 09:00:00'),('S005',62,74,65,'2026-02-15 09:00:00'),"
            "('S006',35,55,40,'2026-01-15 09:00:00'),('S006',48,60,50,'2026-02-15 09:00:00'),"
            "('S007',77,88,80,'2026-01-15 09:00:00'),('S007',79,90,82,'2026-02-15 09:00:00'),"
            "('S008',65,78,68,'2026-01-15 09:00:00'),('S008',70,82,72,'2026-02-15 09:00:00'),"
            "('S009',90,97,92,'2026-01-15 09:00:00'),('S009',94,98,95,'2026-02-15 09:00:00'),"
            "('S010',55,66,58,'2026-01-15 09:00:00'),('S010',52,64,55,'2026-02-15 09:00:00'),"
            "('S011',70,84,73,'2026-01-15 09:00:00'),('S011',74,86,76,'2026-02-15 09:00:00'),"
            "('S012',49,72,52,'2026-01-15 09:00:00'),('S012',44,68,47,'2026-02-15 09:00:00');";
        if (!exec_sql(db, seed_academics)) return false;
    }

    if (table_empty("behavior_records")) {
        // S012 has no check-ins on purpose: aggregation falls back to defaults.
        const char* seed_behaviors =
            "INSERT INTO behavior_records(student_id,mood_score,sleep_hours,study_hours,text_feedback,recorded_at) VALUES"
            "('S001',5,7.5,6,'I feel confident and motivated about my project','2026-01-20 18:00:00'),"
            "('S001',4,8,5.5,'Great week, learning a lot','2026-02-20 18:00:00'),"
            "('S002',3,6.5,4.5,'Okay week, a bit tired but managing','2026-01-20 18:00:00'),"
            "('S002',3,6,4,'Deadlines are stressful but I am coping','2026-02-20 18:00:00'),"
            "('S003',2,4.5,2,'I am overwhelmed and anxious about exams','2026-01-20 18:00:00'),"
            "('S003',1,4,1.5,'Cannot sleep, feeling hopeless and exhausted','2026-02-20 18:00:00'),"
            "('S004',4,7,5,'Enjoying the lab work, feeling good','2026-01-20 18:00:00'),"
            "('S004',5,7.5,6,'Proud of my progress this month','2026-02-20 18:00:00'),"
            "('S005',3,6,3.5,NULL,'2026-01-20 18:00:00'),"
            "('S005',4,6.5,4,'Things are getting better','2026-02-20 18:00:00'),"
            "('S006',2,5,2.5,'Struggling to keep up and feeling lost','2026-01-20 18:00:00'),"
            "('S006',3,5.5,3,'A little less worried now','2026-02-20 18:00:00'),"
            "('S007',4,7,5,'Good balance between study and rest','2026-01-20 18:00:00'),"
            "('S007',4,7.5,5,'Happy with my grades','2026-02-20 18:00:00'),"
            "('S008',2,5,4,'Too much pressure, I feel burnt out','2026-01-20 18:00:00'),"
            "('S008',2,5.5,4.5,'Still stressed and tired','2026-02-20 18:00:00'),"
            "('S009',5,8,6,'Excited and inspired by the course','2026-01-20 18:00:00'),"
            "('S009',5,8,6.5,'Everything is going great','2026-02-20 18:00:00'),"
            "('S010',3,6,3,'Average week','2026-01-20 18:00:00'),"
            "('S010',3,6.5,3.5,NULL,'2026-02-20 18:00:00'),"
            "('S011',4,7,4.5,'Feeling positive about the term','2026-01-20 18:00:00'),"
            "('S011',3,6.5,4,'A bit busy but fine','2026-02-20 18:00:00');";
        if (!exec_sql(db, seed_behaviors)) return false;
    }

    return true;
}

/* =========================
   Persistence helpers (DB)
   ========================= */

// INSERT student row.
bool db_add_student(sqlite3* db, const Student& s) {
    const char* sql = "INSERT INTO students(student_id,name,email,role,department) VALUES(?,?,?,?,?);";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(st, 1, s.student_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 2, s.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 3, s.email.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 4, s.role.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 5, s.department.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

// INSERT one academic snapshot.
bool db_add_academic_record(sqlite3* db, const AcademicRecord& r) {
    const char* sql =
        "INSERT INTO academic_records(student_id,marks,attendance,assignment_score,recorded_at) "
        "VALUES(?,?,?,?,COALESCE(?,CURRENT_TIMESTAMP));";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(st, 1, r.student_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(st, 2, r.marks);
    sqlite3_bind_double(st, 3, r.attendance);
    sqlite3_bind_double(st, 4, r.assignment_score);
    bind_timestamp(st, 5, r.recorded_at);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

// INSERT one wellbeing check-in. A missing text_feedback is stored as NULL.
bool db_add_behavior_record(sqlite3* db, const BehaviorRecord& r) {
    const char* sql =
        "INSERT INTO behavior_records(student_id,mood_score,sleep_hours,study_hours,text_feedback,recorded_at) "
        "VALUES(?,?,?,?,?,COALESCE(?,CURRENT_TIMESTAMP));";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(st, 1, r.student_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(st, 2, r.mood_score);
    sqlite3_bind_double(st, 3, r.sleep_hours);
    sqlite3_bind_double(st, 4, r.study_hours);
    if (r.text_feedback) sqlite3_bind_text(st, 5, r.text_feedback->c_str(), -1, SQLITE_TRANSIENT);
    else sqlite3_bind_null(st, 5);
    bind_timestamp(st, 6, r.recorded_at);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

// A check-in writes one row into each record table, so run both inside one
// transaction.
bool db_add_check_in(sqlite3* db, const BehaviorRecord& b, const AcademicRecord& a, std::string& error) {
    if (!exec_sql(db, "BEGIN;")) { error = sqlite3_errmsg(db); return false; }
    if (db_add_behavior_record(db, b) && db_add_academic_record(db, a) && exec_sql(db, "COMMIT;"))
        return true;
    error = sqlite3_errmsg(db);
    if (!exec_sql(db, "ROLLBACK;"))
        log_error("check-in rollback failed for " + b.student_id);
    return false;
}

// Query helpers --------------------------------------------------------------

bool db_list_students(sqlite3* db, const std::optional<std::string>& department, std::vector<Student>& out) {
    out.clear();
    const char* sql = department
        ? "SELECT student_id,name,email,role,department FROM students "
          "WHERE role='student' AND department=? ORDER BY student_id;"
        : "SELECT student_id,name,email,role,department FROM students "
          "WHERE role='student' ORDER BY student_id;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return false;
    if (department) sqlite3_bind_text(st, 1, department->c_str(), -1, SQLITE_TRANSIENT);

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        Student s;
        s.student_id = column_string(st, 0);
        s.name = column_string(st, 1);
        s.email = column_string(st, 2);
        s.role = column_string(st, 3);
        s.department = column_string(st, 4);
        out.push_back(s);
    }
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

bool db_list_academic_records(sqlite3* db, const std::string& student_id, std::vector<AcademicRecord>& out) {
    out.clear();
    const char* sql =
        "SELECT student_id,marks,attendance,assignment_score,recorded_at FROM academic_records "
        "WHERE student_id=? ORDER BY recorded_at, id;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(st, 1, student_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        AcademicRecord r;
        r.student_id = column_string(st, 0);
        r.marks = sqlite3_column_double(st, 1);
        r.attendance = sqlite3_column_double(st, 2);
        r.assignment_score = sqlite3_column_double(st, 3);
        r.recorded_at = column_string(st, 4);
        out.push_back(r);
    }
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

bool db_list_behavior_records(sqlite3* db, const std::string& student_id, std::vector<BehaviorRecord>& out) {
    out.clear();
    const char* sql =
        "SELECT student_id,mood_score,sleep_hours,study_hours,text_feedback,recorded_at FROM behavior_records "
        "WHERE student_id=? ORDER BY recorded_at, id;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(st, 1, student_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        BehaviorRecord r;
        r.student_id = column_string(st, 0);
        r.mood_score = sqlite3_column_int(st, 1);
        r.sleep_hours = sqlite3_column_double(st, 2);
        r.study_hours = sqlite3_column_double(st, 3);
        if (sqlite3_column_type(st, 4) != SQLITE_NULL) r.text_feedback = column_string(st, 4);
        r.recorded_at = column_string(st, 5);
        out.push_back(r);
    }
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

// Quick counts for live dashboard/menu. One round-trip using scalar subqueries.
bool db_get_counts(sqlite3* db, DbCounts& out) {
    static const char* SQL =
        "SELECT "
        " (SELECT COUNT(*) FROM students WHERE role='student') AS s, "
        " (SELECT COUNT(*) FROM academic_records) AS a, "
        " (SELECT COUNT(*) FROM behavior_records) AS b;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, SQL, -1, &st, nullptr) != SQLITE_OK) {
        return false;
    }

    bool ok = false;
    if (sqlite3_step(st) == SQLITE_ROW) {
        out.students = sqlite3_column_int(st, 0);
        out.academic_records = sqlite3_column_int(st, 1);
        out.behavior_records = sqlite3_column_int(st, 2);
        ok = true;
    }
    sqlite3_finalize(st);
    return ok;
}

/* =========================
   SqliteRecordStore
   ========================= */

std::string SqliteRecordStore::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "no database connection";
}

std::vector<Student> SqliteRecordStore::list_students(const std::optional<std::string>& department) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Student> out;
    if (!db_list_students(db_, department, out))
        throw StorageError("listing students failed: " + last_error());
    return out;
}

std::vector<AcademicRecord> SqliteRecordStore::list_academic_records(const std::string& student_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<AcademicRecord> out;
    if (!db_list_academic_records(db_, student_id, out))
        throw StorageError("listing academic records failed: " + last_error());
    return out;
}

std::vector<BehaviorRecord> SqliteRecordStore::list_behavior_records(const std::string& student_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<BehaviorRecord> out;
    if (!db_list_behavior_records(db_, student_id, out))
        throw StorageError("listing behavior records failed: " + last_error());
    return out;
}

void SqliteRecordStore::add_academic_record(const AcademicRecord& r) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_add_academic_record(db_, r))
        throw StorageError("adding academic record for " + r.student_id + " failed: " + last_error());
}

void SqliteRecordStore::add_behavior_record(const BehaviorRecord& r) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_add_behavior_record(db_, r))
        throw StorageError("adding behavior record for " + r.student_id + " failed: " + last_error());
}

void SqliteRecordStore::add_check_in(const BehaviorRecord& b, const AcademicRecord& a) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::string error;
    if (!db_add_check_in(db_, b, a, error))
        throw StorageError("adding check-in for " + b.student_id + " failed: " + error);
}

void SqliteRecordStore::add_student(const Student& s) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!db_add_student(db_, s))
        throw StorageError("adding student " + s.student_id + " failed: " + last_error());
}

DbCounts SqliteRecordStore::counts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    DbCounts c;
    if (!db_get_counts(db_, c)) throw StorageError("counting rows failed: " + last_error());
    return c;
}
