#pragma once

#include "refstore/v1.hpp"
#include "service_context.hpp"

namespace refstore::service {

/*
  Store contract.

  Every call returns its response message; failures never escape as
  exceptions but arrive as the `error` variant of the response.
*/
class ReferenceService {
 public:
  explicit ReferenceService(ServiceContext ctx);

  refstore::v1::WriteResponse CreateOrUpdate(const refstore::v1::CreateOrUpdateRequest& req);

  refstore::v1::ReadResponse Read(const refstore::v1::ReadRequest& req);

  refstore::v1::WriteResponse Update(const refstore::v1::UpdateRequest& req);

  refstore::v1::DeleteResponse Delete(const refstore::v1::DeleteRequest& req);

  refstore::v1::ListResponse List(const refstore::v1::ListRequest& req);

  refstore::v1::CleanupResponse Cleanup(const refstore::v1::CleanupRequest& req);

  refstore::v1::ComposeResponse Compose(const refstore::v1::ComposeRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace refstore::service
