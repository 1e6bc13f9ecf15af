#include "error_mapping.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace refstore::service {

namespace {

refstore::v1::ErrorCode ToProtoCode(util::ErrorCode code) {
  switch (code) {
    case util::ErrorCode::InvalidReferenceName:
      return refstore::v1::ERROR_CODE_INVALID_REFERENCE_NAME;
    case util::ErrorCode::ReferenceNotFound:
      return refstore::v1::ERROR_CODE_REFERENCE_NOT_FOUND;
    case util::ErrorCode::StorageIOError:
      return refstore::v1::ERROR_CODE_STORAGE_IO;
    case util::ErrorCode::FormatError:
      return refstore::v1::ERROR_CODE_FORMAT;
  }
  return refstore::v1::ERROR_CODE_INTERNAL;
}

} // namespace

refstore::v1::Error ToError(const std::exception& e) {
  refstore::v1::Error error;
  error.set_message(e.what());

  if (const auto* ref_error = dynamic_cast<const util::ReferenceError*>(&e)) {
    error.set_code(ToProtoCode(ref_error->code()));
    error.set_name(ref_error->name());
    error.set_operation(ref_error->operation());
    return error;
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    error.set_code(refstore::v1::ERROR_CODE_INVALID_ARGUMENT);
    return error;
  }

  error.set_code(refstore::v1::ERROR_CODE_INTERNAL);
  return error;
}

} // namespace refstore::service
