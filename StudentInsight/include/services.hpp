#pragma once
#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 services.hpp - Record source interface and the in-memory store
-------------------------------------------------------------------------------
This header defines:
  - RecordSource: the read-only queries the analytics core needs from the
    persistence layer ("students", "academic records for X", "behavior
    records for X").
  - RecordStore: RecordSource plus the record inserts, and add_check_in which
    writes a behavior and an academic record together.
  - DataStore: a simple in-memory table set, with small inline helpers.
  - MemoryRecordStore: RecordStore over a DataStore (tests, demos).

The SQLite implementation lives in db.hpp (SqliteRecordStore).

Conventions
  - Record lists come back in insertion (time) order.
  - list_students only returns role "student" rows.
  - Helpers return bool to indicate success/failure; writes are rejected when
    the referenced student does not exist.
-------------------------------------------------------------------------------
*/

class RecordSource {
public:
    virtual ~RecordSource() = default;

    // All students, optionally restricted to one department.
    virtual std::vector<Student> list_students(
        const std::optional<std::string>& department = std::nullopt) const = 0;

    virtual std::vector<AcademicRecord> list_academic_records(const std::string& student_id) const = 0;
    virtual std::vector<BehaviorRecord> list_behavior_records(const std::string& student_id) const = 0;
};

class RecordStore : public RecordSource {
public:
    virtual void add_academic_record(const AcademicRecord& r) = 0;
    virtual void add_behavior_record(const BehaviorRecord& r) = 0;
    // Both records or neither.
    virtual void add_check_in(const BehaviorRecord& b, const AcademicRecord& a) = 0;
};

// Our simple in-memory "database"
struct DataStore {
    std::vector<Student>        all_students;
    std::vector<AcademicRecord> all_academics;
    std::vector<BehaviorRecord> all_behaviors;
};

// ==========================
// STUDENTS
// ==========================

inline bool exists_student(const DataStore& data, const std::string& student_id) {
    return std::any_of(data.all_students.begin(), data.all_students.end(),
        [&](const Student& x) { return x.student_id == student_id; });
}

// Add a student if student_id is unique. Returns true on success.
inline bool add_student(DataStore& data, const Student& s) {
    if (exists_student(data, s.student_id)) return false; // already exists
    data.all_students.push_back(s);
    return true;
}

// ==========================
// RECORDS
// ==========================

inline bool add_academic_record(DataStore& data, const AcademicRecord& r) {
    if (!exists_student(data, r.student_id)) return false;
    data.all_academics.push_back(r);
    return true;
}

inline bool add_behavior_record(DataStore& data, const BehaviorRecord& r) {
    if (!exists_student(data, r.student_id)) return false;
    data.all_behaviors.push_back(r);
    return true;
}

// ==========================
// RecordStore adapter
// ==========================

class MemoryRecordStore : public RecordStore {
public:
    explicit MemoryRecordStore(DataStore& data) : data_(data) {}

    std::vector<Student> list_students(
        const std::optional<std::string>& department = std::nullopt) const override {
        std::vector<Student> out;
        for (const auto& s : data_.all_students) {
            if (s.role != "student") continue;
            if (department && s.department != *department) continue;
            out.push_back(s);
        }
        return out;
    }

    std::vector<AcademicRecord> list_academic_records(const std::string& student_id) const override {
        std::vector<AcademicRecord> out;
        for (const auto& r : data_.all_academics)
            if (r.student_id == student_id) out.push_back(r);
        return out;
    }

    std::vector<BehaviorRecord> list_behavior_records(const std::string& student_id) const override {
        std::vector<BehaviorRecord> out;
        for (const auto& r : data_.all_behaviors)
            if (r.student_id == student_id) out.push_back(r);
        return out;
    }

    void add_academic_record(const AcademicRecord& r) override;
    void add_behavior_record(const BehaviorRecord& r) override;
    void add_check_in(const BehaviorRecord& b, const AcademicRecord& a) override;

private:
    DataStore& data_;
};

inline void MemoryRecordStore::add_academic_record(const AcademicRecord& r) {
    if (!::add_academic_record(data_, r))
        throw StorageError("unknown student: " + r.student_id);
}

inline void MemoryRecordStore::add_behavior_record(const BehaviorRecord& r) {
    if (!::add_behavior_record(data_, r))
        throw StorageError("unknown student: " + r.student_id);
}

inline void MemoryRecordStore::add_check_in(const BehaviorRecord& b, const AcademicRecord& a) {
    for (const std::string* id : { &b.student_id, &a.student_id })
        if (!exists_student(data_, *id)) throw StorageError("unknown student: " + *id);
    data_.all_behaviors.push_back(b);
    data_.all_academics.push_back(a);
}
