#include "reference_composer.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/reference_store.hpp"
#include "internal/util/errors.hpp"

namespace refstore::service {

ReferenceComposer::ReferenceComposer(std::shared_ptr<store::ReferenceStore> store) : store_(std::move(store)) {
}

ComposedContent ReferenceComposer::Compose(const ComposeInput& input) const {
  if (!input.ref.empty()) {
    auto reference = store_->Read(input.ref);
    return {std::move(reference.record.content), {std::move(reference.name)}};
  }

  if (!input.refs.empty()) {
    ComposedContent composed;
    for (const auto& name : input.refs) {
      try {
        auto reference = store_->Read(name);
        if (!composed.sources.empty()) {
          composed.content += kSeparator;
        }
        composed.content += reference.record.content;
        composed.sources.push_back(std::move(reference.name));
      } catch (const util::ReferenceNotFound&) {
        REFSTORE_LOG_WARN("compose skipped missing reference", {observability::StringField("name", name)});
      }
    }
    if (!composed.sources.empty()) {
      return composed;
    }
  }

  if (!input.prompt_ref.empty()) {
    auto reference = store_->Read(input.prompt_ref);
    return {std::move(reference.record.content), {std::move(reference.name)}};
  }

  if (!input.prompt.empty()) {
    return {input.prompt, {}};
  }

  throw std::invalid_argument("no input provided: use prompt, ref, refs or prompt_ref");
}

} // namespace refstore::service
