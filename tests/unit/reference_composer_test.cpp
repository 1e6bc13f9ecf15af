#include "internal/service/reference_composer.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/store/reference_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using refstore::service::ComposeInput;
using refstore::service::ReferenceComposer;
using refstore::store::ReferenceStore;

std::shared_ptr<ReferenceStore> MakeStore(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "refstore_composer_tests" / test_name;
  std::filesystem::remove_all(root);

  ReferenceStore::Options options;
  options.fsync = false;
  auto store    = std::make_shared<ReferenceStore>(root, options);
  store->CreateOrUpdate("sites/reddit", "reddit body");
  store->CreateOrUpdate("sites/twitter", "twitter body");
  store->CreateOrUpdate("personas/shakespeare", "thee and thou");
  return store;
}

void TestRefWinsOverEverything() {
  ReferenceComposer composer(MakeStore("ref_wins"));

  ComposeInput input;
  input.prompt     = "direct";
  input.ref        = "sites/reddit";
  input.refs       = {"sites/twitter"};
  input.prompt_ref = "personas/shakespeare";

  const auto composed = composer.Compose(input);
  assert(composed.content == "reddit body");
  assert(composed.sources.size() == 1);
  assert(composed.sources[0] == "sites/reddit");
}

void TestRefsAreJoinedInOrder() {
  ReferenceComposer composer(MakeStore("refs_joined"));

  ComposeInput input;
  input.refs = {"sites/twitter", "sites/reddit"};

  const auto composed = composer.Compose(input);
  assert(composed.content == "twitter body\n\n---\n\nreddit body");
  assert(composed.sources.size() == 2);
  assert(composed.sources[0] == "sites/twitter");
}

void TestMissingRefsAreSkipped() {
  ReferenceComposer composer(MakeStore("refs_skip"));

  ComposeInput input;
  input.refs = {"gone/one", "sites/reddit", "gone/two"};

  const auto composed = composer.Compose(input);
  assert(composed.content == "reddit body");
  assert(composed.sources.size() == 1);
}

void TestAllRefsMissingFallsThrough() {
  ReferenceComposer composer(MakeStore("refs_fall_through"));

  ComposeInput input;
  input.refs       = {"gone/one"};
  input.prompt_ref = "personas/shakespeare";
  assert(composer.Compose(input).content == "thee and thou");

  input.prompt_ref.clear();
  input.prompt = "direct text";
  const auto composed = composer.Compose(input);
  assert(composed.content == "direct text");
  assert(composed.sources.empty());
}

void TestMissingSingleRefFails() {
  ReferenceComposer composer(MakeStore("ref_missing"));

  ComposeInput input;
  input.ref    = "gone";
  input.prompt = "would be ignored";

  bool threw = false;
  try {
    composer.Compose(input);
  } catch (const refstore::util::ReferenceNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestNoInputIsInvalidArgument() {
  ReferenceComposer composer(MakeStore("no_input"));

  bool threw = false;
  try {
    composer.Compose(ComposeInput{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRefWinsOverEverything();
  TestRefsAreJoinedInOrder();
  TestMissingRefsAreSkipped();
  TestAllRefsMissingFallsThrough();
  TestMissingSingleRefFails();
  TestNoInputIsInvalidArgument();

  std::cout << "refstore_unit_reference_composer: pass\n";
  return 0;
}
