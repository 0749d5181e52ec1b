#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "models.hpp"
#include "services.hpp"   // RecordStore interface

/*
-------------------------------------------------------------------------------
 db.hpp - Public interface to SQLite persistence layer
-------------------------------------------------------------------------------

This header declares all functions that interact with the SQLite database.
They provide a clean, minimal API so higher-level code (analytics, ML,
console) doesn't need to deal with raw sqlite3_* calls.

Design:
  - Each db_* function returns `bool` to indicate success/failure.
  - `SqliteRecordStore` wraps a connection behind the RecordStore interface
    and turns a failed call into StorageError.
  - `DbCounts` provides live counts (students, academic and behavior records)
    for menus.

Usage convention:
  - Call `db_open` once at startup, then `db_init_and_seed`.
  - Always call `db_close` before exiting.
-------------------------------------------------------------------------------
*/

/// Opens (creates if not exists) the SQLite DB file at path (":memory:" works).
/// Returns true on success, false on failure. On failure, `db` is set to nullptr.
bool db_open(sqlite3*& db, const std::string& path);

/// Close DB (safe if db==nullptr). Call once at shutdown.
void db_close(sqlite3* db);

/// Create tables if missing. With `seed_demo` set, insert a small demo cohort
/// into empty tables. Safe to call on every startup.
bool db_init_and_seed(sqlite3* db, bool seed_demo = true);

// ==========================
// INSERT operations
// ==========================

bool db_add_student(sqlite3* db, const Student& s);

/// An empty recorded_at lets the database stamp the row with the current time.
bool db_add_academic_record(sqlite3* db, const AcademicRecord& r);
bool db_add_behavior_record(sqlite3* db, const BehaviorRecord& r);

/// Both inserts in one transaction; rolled back if either fails. On failure
/// `error` holds the message of the statement that failed.
bool db_add_check_in(sqlite3* db, const BehaviorRecord& b, const AcademicRecord& a, std::string& error);

// ==========================
// SELECT operations
// ==========================

/// Students with role 'student', optionally one department, ordered by id.
bool db_list_students(sqlite3* db, const std::optional<std::string>& department, std::vector<Student>& out);

/// Records for one student in time order.
bool db_list_academic_records(sqlite3* db, const std::string& student_id, std::vector<AcademicRecord>& out);
bool db_list_behavior_records(sqlite3* db, const std::string& student_id, std::vector<BehaviorRecord>& out);

// ==========================
// Counts (for dashboards/menus)
// ==========================

/// Simple struct with live counts from DB.
struct DbCounts {
    int students = 0;
    int academic_records = 0;
    int behavior_records = 0;
};

/// Populate `out` with counts of students and both record tables.
/// Returns true on success.
bool db_get_counts(sqlite3* db, DbCounts& out);

// ==========================
// RecordStore adapter
// ==========================

class SqliteRecordStore : public RecordStore {
public:
    /// Does not take ownership of `db`.
    explicit SqliteRecordStore(sqlite3* db) : db_(db) {}

    std::vector<Student> list_students(
        const std::optional<std::string>& department = std::nullopt) const override;
    std::vector<AcademicRecord> list_academic_records(const std::string& student_id) const override;
    std::vector<BehaviorRecord> list_behavior_records(const std::string& student_id) const override;

    void add_academic_record(const AcademicRecord& r) override;
    void add_behavior_record(const BehaviorRecord& r) override;
    void add_check_in(const BehaviorRecord& b, const AcademicRecord& a) override;

    void add_student(const Student& s);
    DbCounts counts() const;

private:
    std::string last_error() const;

    sqlite3* db_;
    mutable std::mutex mtx_;   // one statement at a time on this connection
};
