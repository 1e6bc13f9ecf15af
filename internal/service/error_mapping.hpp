#pragma once

#include <exception>

#include "refstore/v1.hpp"

namespace refstore::service {

/*
  Converts internal exceptions into contract errors.

  util::ReferenceError keeps its kind, name and operation;
  std::invalid_argument becomes ERROR_CODE_INVALID_ARGUMENT and anything
  else ERROR_CODE_INTERNAL.
*/
refstore::v1::Error ToError(const std::exception& e);

} // namespace refstore::service
