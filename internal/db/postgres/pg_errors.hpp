#pragma once

#include <exception>

namespace strata::db::postgres {

/*
  Default ErrorClassifier for the postgres driver.

  True for pqxx::serialization_failure, pqxx::deadlock_detected and any
  other pqxx::sql_error whose SQLSTATE is 40001 or 40P01.
*/
bool IsSerializationConflict(const std::exception_ptr& error);

} // namespace strata::db::postgres
