#pragma once

#include <sqlite_modern_cpp.h>

#include <string>

namespace docqa_core {

enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, NotADatabase, Generic };

inline DbErrorKind classify_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    // Also what SQLCipher reports for a wrong key
    case SQLITE_NOTADB:
      return DbErrorKind::NotADatabase;
    default:
      return DbErrorKind::Generic;
  }
}

inline std::string kind_to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked:
      return "busy_or_locked";
    case DbErrorKind::Constraint:
      return "constraint";
    case DbErrorKind::Readonly:
      return "readonly";
    case DbErrorKind::Io:
      return "io";
    case DbErrorKind::CantOpen:
      return "cantopen";
    case DbErrorKind::NotADatabase:
      return "notadb";
    default:
      return "generic";
  }
}

inline bool is_unique_violation(const sqlite::sqlite_exception &e) {
  return e.get_extended_code() == SQLITE_CONSTRAINT_UNIQUE;
}

inline std::string format_db_error(const std::string &operation, const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  const DbErrorKind kind = classify_sqlite_code(code);
  return operation + " failed: (" + kind_to_string(kind) + ") " + e.what() +
         " [code=" + std::to_string(code) + ", xcode=" + std::to_string(e.get_extended_code()) +
         "]";
}

}  // namespace docqa_core
