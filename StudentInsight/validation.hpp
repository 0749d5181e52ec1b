#pragma once
#include <string>
#include <regex>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>
#include <cctype>   // for std::isspace
#include "errors.hpp"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 validation.hpp - Input validation and console prompt helpers (ASCII only)
-------------------------------------------------------------------------------
What this file provides:
  - trim: basic whitespace trimming helper.
  - Validators: student id, name, email, department.
  - Record checks that throw InvalidInputError:
      * validate_academic_record  -> marks/attendance/assignment in [0,100]
      * validate_behavior_record  -> mood in [1,5], hours in [0,24]
      * validate_feature_row      -> exactly kFeatureCount finite values
  - Prompt helpers for the interactive console:
      * prompt_until_valid_or_back    -> text with validator and Back/Exit
      * prompt_number_or_back         -> numeric with range and Back/Exit
      * prompt_scale_or_back          -> whole number on a 1..N scale
      * prompt_optional_text_or_back  -> free text, Enter = none

Conventions:
  - Special inputs:
      Back: "0", "b", "B"
      Exit: "x", "X", "q", "Q"
  - All characters are plain ASCII (no Unicode dashes).
-------------------------------------------------------------------------------
*/

// Trim leading and trailing whitespace.
inline std::string trim(std::string s) {
    auto ws = [](unsigned char ch) { return std::isspace(ch) != 0; };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

// e.g. S001, S12345  (S + 3-6 digits)
inline bool is_valid_student_id(const std::string& x) {
    static const std::regex re("^S\\d{3,6}$");
    return std::regex_match(x, re);
}

// letters, spaces, hyphen, apostrophe; 2..40 chars
inline bool is_valid_name(const std::string& x) {
    if (x.size() < 2 || x.size() > 40) return false;
    static const std::regex re("^[A-Za-z '\\-]+$");
    return std::regex_match(x, re);
}

// local@domain.tld, nothing fancy
inline bool is_valid_email(const std::string& x) {
    static const std::regex re("^[A-Za-z0-9._%+\\-]+@[A-Za-z0-9.\\-]+\\.[A-Za-z]{2,}$");
    return std::regex_match(x, re);
}

// non-empty, max 60
inline bool is_valid_department(const std::string& x) {
    return !trim(x).empty() && x.size() <= 60;
}

// ---- record range checks ----

inline void require_in_range(double v, double lo, double hi, const char* field) {
    if (!std::isfinite(v) || v < lo || v > hi)
        throw InvalidInputError(std::string(field) + " must be between " +
            std::to_string(lo) + " and " + std::to_string(hi));
}

inline void validate_academic_record(const AcademicRecord& r) {
    require_in_range(r.marks, 0, 100, "marks");
    require_in_range(r.attendance, 0, 100, "attendance");
    require_in_range(r.assignment_score, 0, 100, "assignment_score");
}

inline void validate_behavior_record(const BehaviorRecord& r) {
    if (r.mood_score < 1 || r.mood_score > 5)
        throw InvalidInputError("mood_score must be between 1 and 5");
    require_in_range(r.sleep_hours, 0, 24, "sleep_hours");
    require_in_range(r.study_hours, 0, 24, "study_hours");
}

inline void validate_feature_row(const std::vector<double>& row) {
    if (row.size() != kFeatureCount)
        throw InvalidInputError("feature row has " + std::to_string(row.size()) +
            " values, expected " + std::to_string(kFeatureCount));
    for (double v : row)
        if (!std::isfinite(v)) throw InvalidInputError("feature row contains a non-finite value");
}

// ---- back / exit aware prompts ----
enum class InputCtl { Ok, Back, Exit };

inline bool is_back_word(const std::string& v) { return v == "0" || v == "b" || v == "B"; }
inline bool is_exit_word(const std::string& v) { return v == "x" || v == "X" || v == "q" || v == "Q"; }

// Read one line; on stream failure reset and try again. Returns false at EOF.
inline bool read_line(std::string& v) {
    if (std::getline(std::cin, v)) return true;
    if (std::cin.eof()) return false;
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    v.clear();
    return true;
}

// String prompt that accepts Back/Exit keywords.
// Back: "0", "b", "B"   Exit: "x","X","q","Q"
inline InputCtl prompt_until_valid_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg)
{
    for (;;) {
        std::string v;
        std::cout << label << " (0=Back, x=Exit): ";
        if (!read_line(v)) return InputCtl::Exit;
        v = trim(v);
        if (is_back_word(v)) return InputCtl::Back;
        if (is_exit_word(v)) return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        std::cout << "  -> " << error_msg << "\n";
    }
}

// Number prompt with range + Back/Exit. "0" means Back, so ranges that
// include zero take it as a value only when written as "0.0".
inline InputCtl prompt_number_or_back(
    const std::string& label,
    double& out,
    double lo, double hi)
{
    for (;;) {
        std::string v;
        std::cout << label << " [" << lo << "-" << hi << "] (0=Back, x=Exit): ";
        if (!read_line(v)) return InputCtl::Exit;
        v = trim(v);
        if (is_back_word(v)) return InputCtl::Back;
        if (is_exit_word(v)) return InputCtl::Exit;
        try {
            std::size_t used = 0;
            double d = std::stod(v, &used);
            if (used != v.size()) { std::cout << "  -> Please enter a number.\n"; continue; }
            if (d < lo || d > hi) { std::cout << "  -> Must be between " << lo << " and " << hi << ".\n"; continue; }
            out = d; return InputCtl::Ok;
        }
        catch (const std::logic_error&) {
            std::cout << "  -> Please enter a number.\n";
        }
    }
}

// Whole-number prompt for questionnaire scales; "2.7" is rejected, not truncated.
inline InputCtl prompt_scale_or_back(
    const std::string& label,
    int& out,
    int lo, int hi)
{
    for (;;) {
        std::string v;
        std::cout << label << " [" << lo << "-" << hi << "] (0=Back, x=Exit): ";
        if (!read_line(v)) return InputCtl::Exit;
        v = trim(v);
        if (is_back_word(v)) return InputCtl::Back;
        if (is_exit_word(v)) return InputCtl::Exit;
        try {
            std::size_t used = 0;
            int n = std::stoi(v, &used);
            if (used != v.size()) { std::cout << "  -> Please enter a whole number.\n"; continue; }
            if (n < lo || n > hi) { std::cout << "  -> Must be between " << lo << " and " << hi << ".\n"; continue; }
            out = n; return InputCtl::Ok;
        }
        catch (const std::logic_error&) {
            std::cout << "  -> Please enter a whole number.\n";
        }
    }
}

// Free-text prompt: Enter = no text, 0/b = Back, x/q = Exit.
inline InputCtl prompt_optional_text_or_back(const std::string& label, std::string& out)
{
    std::string v;
    std::cout << label << " (Enter=skip, 0=Back, x=Exit): ";
    if (!read_line(v)) return InputCtl::Exit;
    v = trim(v);
    if (is_back_word(v)) return InputCtl::Back;
    if (is_exit_word(v)) return InputCtl::Exit;
    out = v;
    return InputCtl::Ok;
}
