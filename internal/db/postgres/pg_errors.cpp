#include "pg_errors.hpp"

#include <pqxx/pqxx>

#include "internal/db/executor/error_classifier.hpp"

namespace strata::db::postgres {

bool IsSerializationConflict(const std::exception_ptr& error) {
  if (!error) {
    return false;
  }

  try {
    std::rethrow_exception(error);
  } catch (const pqxx::serialization_failure&) {
    return true;
  } catch (const pqxx::deadlock_detected&) {
    return true;
  } catch (const pqxx::sql_error& e) {
    return IsSerializationSqlState(e.sqlstate());
  } catch (...) {
    // not a driver error at all
    return false;
  }
}

} // namespace strata::db::postgres
