#pragma once

#include <memory>
#include <string>
#include <vector>

namespace refstore::store {
class ReferenceStore;
}

namespace refstore::service {

struct ComposeInput {
  std::string              prompt;
  std::string              ref;
  std::vector<std::string> refs;
  std::string              prompt_ref;
};

struct ComposedContent {
  std::string              content;
  std::vector<std::string> sources; // names read, empty for a direct prompt
};

/*
  Builds tool input from references.

  Priority: ref > refs > prompt_ref > prompt. A missing `ref` or `prompt_ref`
  fails with ReferenceNotFound. Missing entries of `refs` are skipped; if none
  of them exist the next source is tried. Throws std::invalid_argument when
  nothing usable was supplied.
*/
class ReferenceComposer {
 public:
  explicit ReferenceComposer(std::shared_ptr<store::ReferenceStore> store);

  ComposedContent Compose(const ComposeInput& input) const;

  static constexpr const char* kSeparator = "\n\n---\n\n";

 private:
  std::shared_ptr<store::ReferenceStore> store_;
};

} // namespace refstore::service
