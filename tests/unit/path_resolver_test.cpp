#include "internal/naming/path_resolver.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using refstore::naming::PathResolver;
using refstore::naming::RecordFormat;
using refstore::naming::ReferenceLocation;
using refstore::util::InvalidReferenceName;

const std::filesystem::path kRoot = "/var/lib/refstore/refs";

bool Rejects(const PathResolver& resolver, const std::string& name) {
  try {
    resolver.Resolve(name);
  } catch (const InvalidReferenceName& e) {
    assert(e.operation() == "resolve");
    return true;
  }
  return false;
}

void TestResolveMirrorsSegments() {
  PathResolver resolver(kRoot);

  const auto location = resolver.Resolve("prompts/greeting");
  assert(location.base() == kRoot / "prompts" / "greeting");
  assert(location.CurrentFile() == kRoot / "prompts" / "greeting.yaml");
  assert(location.LegacyFile() == kRoot / "prompts" / "greeting.json");
}

void TestResolveStripsOuterSeparators() {
  PathResolver resolver(kRoot);

  assert(resolver.Resolve("/a/b/") == resolver.Resolve("a/b"));
  assert(resolver.Resolve("//a//") == resolver.Resolve("a"));
  assert(PathResolver::Canonicalize("/sites/reddit/") == "sites/reddit");
}

void TestRoundTripsValidNames() {
  PathResolver resolver(kRoot);

  const std::vector<std::string> names = {"a", "a/b", "sites/reddit", "pipeline/step3", "UPPER/lower", "dots.in.name/x", "spaces are ok/y",
                                          "x/y.yaml", "unicode/\xc3\xa9t\xc3\xa9", "...", "a/.hidden"};
  for (const auto& name : names) {
    assert(PathResolver::IsValid(name));
    assert(resolver.Unresolve(resolver.Resolve(name)) == name);
  }
}

void TestRejectsInvalidNames() {
  PathResolver resolver(kRoot);

  assert(Rejects(resolver, ""));
  assert(Rejects(resolver, "/"));
  assert(Rejects(resolver, "///"));
  assert(Rejects(resolver, ".."));
  assert(Rejects(resolver, "a/../b"));
  assert(Rejects(resolver, "a/./b"));
  assert(Rejects(resolver, "a//b"));
  assert(Rejects(resolver, std::string("a\0b", 3)));
  assert(Rejects(resolver, "a\nb"));
  assert(Rejects(resolver, "a\\b"));
  assert(Rejects(resolver, "dir.yaml/x"));
  assert(Rejects(resolver, "dir.json/x"));
  assert(Rejects(resolver, std::string(201, 'x')));
  assert(!Rejects(resolver, std::string(200, 'x')));
}

void TestDistinctNamesNeverShareALocation() {
  PathResolver resolver(kRoot);

  assert(!(resolver.Resolve("a/b") == resolver.Resolve("a/bc")));
  assert(!(resolver.Resolve("ab") == resolver.Resolve("a/b")));
  assert(!(resolver.Resolve("A") == resolver.Resolve("a")));
}

void TestLocationForFileMapsRecordFiles() {
  PathResolver resolver(kRoot);

  const auto current = resolver.LocationForFile(kRoot / "a" / "b.yaml");
  assert(current.has_value());
  assert(current->second == RecordFormat::kCurrent);
  assert(resolver.Unresolve(current->first) == "a/b");

  const auto legacy = resolver.LocationForFile(kRoot / "a" / "b.json");
  assert(legacy.has_value());
  assert(legacy->second == RecordFormat::kLegacy);
  assert(legacy->first == current->first);

  assert(!resolver.LocationForFile(kRoot / "a" / "b.txt").has_value());
  assert(!resolver.LocationForFile(kRoot / "a" / ".b.yaml.tmp-1234").has_value());
  assert(!resolver.LocationForFile("/elsewhere/a.yaml").has_value());
}

void TestUnresolveRejectsForeignLocations() {
  PathResolver resolver(kRoot);

  bool threw = false;
  try {
    resolver.Unresolve(ReferenceLocation("/elsewhere/a"));
  } catch (const InvalidReferenceName& e) {
    threw = true;
    assert(e.operation() == "unresolve");
  }
  assert(threw);
}

void TestRelativeRootIsMadeAbsolute() {
  PathResolver resolver("relative/root/");
  assert(resolver.root().is_absolute());
  assert(resolver.root().filename() == "root");
  assert(resolver.Unresolve(resolver.Resolve("n")) == "n");
}

} // namespace

int main() {
  TestResolveMirrorsSegments();
  TestResolveStripsOuterSeparators();
  TestRoundTripsValidNames();
  TestRejectsInvalidNames();
  TestDistinctNamesNeverShareALocation();
  TestLocationForFileMapsRecordFiles();
  TestUnresolveRejectsForeignLocations();
  TestRelativeRootIsMadeAbsolute();

  std::cout << "refstore_unit_path_resolver: pass\n";
  return 0;
}
