#include "reference_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/error_mapping.hpp"
#include "internal/service/reference_composer.hpp"
#include "internal/store/reference_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace refstore::service {

using namespace refstore::v1;

namespace {

// Caller errors are expected traffic; everything else is a server-side fault.
bool IsCallerError(const std::exception& ex) {
  if (const auto* ref_error = dynamic_cast<const util::ReferenceError*>(&ex)) {
    return ref_error->code() == util::ErrorCode::InvalidReferenceName || ref_error->code() == util::ErrorCode::ReferenceNotFound;
  }
  return dynamic_cast<const std::invalid_argument*>(&ex) != nullptr;
}

template <typename Response, typename Fn>
Response ObserveOperation(std::string_view operation, std::string_view name, Fn&& fn) {
  refstore::observability::SpanScope span(operation);
  if (!name.empty()) {
    span.SetAttribute("reference.name", name);
  }

  Response   resp;
  bool       success    = true;
  const auto started_at = std::chrono::steady_clock::now();
  try {
    fn(resp);
  } catch (const std::exception& ex) {
    success = false;
    span.RecordException(ex.what());
    const auto fields = {refstore::observability::StringField("operation", operation), refstore::observability::StringField("name", name),
                         refstore::observability::StringField("error", ex.what())};
    if (IsCallerError(ex)) {
      REFSTORE_LOG_WARN("operation rejected", fields);
    } else {
      REFSTORE_LOG_ERROR("operation failed", fields);
    }
    *resp.mutable_error() = ToError(ex);
  }

  refstore::observability::Metrics::Instance().RecordOperation(operation, success);
  refstore::observability::Metrics::Instance().ObserveOperationLatencyMs(
      operation, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  return resp;
}

void SetWriteResult(const model::WriteResult& result, WriteResponse* resp) {
  auto* ok = resp->mutable_ok();
  ok->set_name(result.name);
  ok->set_version(result.version);
}

} // namespace

ReferenceService::ReferenceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

WriteResponse ReferenceService::CreateOrUpdate(const CreateOrUpdateRequest& req) {
  return ObserveOperation<WriteResponse>("ReferenceService.CreateOrUpdate", req.name(), [&](WriteResponse& resp) {
    std::optional<model::Metadata> metadata;
    if (req.has_metadata()) {
      metadata.emplace();
      for (const auto& [key, value] : req.metadata().entries()) {
        (*metadata)[key] = value;
      }
    }
    SetWriteResult(ctx_.store->CreateOrUpdate(req.name(), req.content(), std::move(metadata)), &resp);
  });
}

ReadResponse ReferenceService::Read(const ReadRequest& req) {
  return ObserveOperation<ReadResponse>("ReferenceService.Read", req.name(), [&](ReadResponse& resp) {
    const auto reference = ctx_.store->Read(req.name());

    auto* ok = resp.mutable_ok();
    ok->set_name(reference.name);
    ok->set_content(reference.record.content);
    for (const auto& [key, value] : reference.record.metadata) {
      (*ok->mutable_metadata())[key] = value;
    }
    ok->set_version(reference.record.version);
    *ok->mutable_created_at() = util::ToProto(reference.record.created_at);
    *ok->mutable_updated_at() = util::ToProto(reference.record.updated_at);
  });
}

WriteResponse ReferenceService::Update(const UpdateRequest& req) {
  return ObserveOperation<WriteResponse>("ReferenceService.Update", req.name(), [&](WriteResponse& resp) {
    SetWriteResult(ctx_.store->Update(req.name(), req.content()), &resp);
  });
}

DeleteResponse ReferenceService::Delete(const DeleteRequest& req) {
  return ObserveOperation<DeleteResponse>("ReferenceService.Delete", req.name(), [&](DeleteResponse& resp) {
    resp.mutable_ok()->set_name(ctx_.store->Delete(req.name()));
    resp.mutable_ok()->set_deleted(true);
  });
}

ListResponse ReferenceService::List(const ListRequest& req) {
  return ObserveOperation<ListResponse>("ReferenceService.List", req.prefix(), [&](ListResponse& resp) {
    const auto names = req.has_prefix() ? ctx_.store->List(req.prefix()) : ctx_.store->List();

    auto* ok = resp.mutable_ok();
    for (const auto& name : names) {
      ok->add_names(name);
    }
    ok->set_count(names.size());
  });
}

CleanupResponse ReferenceService::Cleanup(const CleanupRequest& req) {
  return ObserveOperation<CleanupResponse>("ReferenceService.Cleanup", req.prefix(), [&](CleanupResponse& resp) {
    const auto removed = ctx_.store->Cleanup(req.prefix(), std::chrono::seconds(req.max_age_seconds()));
    resp.mutable_ok()->set_removed(removed);
  });
}

ComposeResponse ReferenceService::Compose(const ComposeRequest& req) {
  return ObserveOperation<ComposeResponse>("ReferenceService.Compose", req.ref(), [&](ComposeResponse& resp) {
    ComposeInput input;
    input.prompt     = req.prompt();
    input.ref        = req.ref();
    input.refs       = {req.refs().begin(), req.refs().end()};
    input.prompt_ref = req.prompt_ref();

    auto  composed = ctx_.composer->Compose(input);
    auto* ok       = resp.mutable_ok();
    ok->set_content(std::move(composed.content));
    for (auto& source : composed.sources) {
      ok->add_sources(std::move(source));
    }
  });
}

} // namespace refstore::service
