#include "internal/manifest/scanner.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/paths.hpp"
#include "support/temp_dir.hpp"

namespace {

namespace fs = std::filesystem;
using sitepull::manifest::ResolveWithinRoot;
using sitepull::manifest::ScanTree;
using sitepull::testing::TempDir;
using sitepull::testing::WriteFile;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void BuildSite(const fs::path& root) {
  WriteFile(root / "index.php", "<?php echo 1;");
  WriteFile(root / "wp-content/uploads/a.jpg", std::string(1000, 'j'));
  WriteFile(root / "wp-content/themes/t/style.css", "body{}");
  WriteFile(root / "empty.txt", "");
  WriteFile(root / ".git/config", "[core]");
  WriteFile(root / "nested/.svn/entries", "x");
  WriteFile(root / ".htaccess", "Deny");
  fs::create_directories(root / "empty-dir");
}

void TestScanListsRegularFilesSorted() {
  TempDir dir("sitepull-scan");
  BuildSite(dir.Path());
  fs::create_symlink(dir.Path() / "index.php", dir.Path() / "link.php");

  const auto entries = ScanTree(dir.Path());

  std::vector<std::string> paths;
  for (const auto& entry : entries) paths.push_back(entry.path());
  const std::vector<std::string> expected = {
      ".htaccess", "empty.txt", "index.php", "wp-content/themes/t/style.css", "wp-content/uploads/a.jpg",
  };
  assert(paths == expected);

  assert(entries[1].size() == 0);
  assert(entries[4].size() == 1000);
  assert(entries[4].mtime() > 0);
}

void TestScanRejectsMissingRoot() {
  TempDir dir("sitepull-scan");
  assert(Throws<sitepull::util::StorageError>([&] { (void)ScanTree(dir.Path() / "nope"); }));
}

void TestNormalizeRelativePath() {
  using sitepull::util::NormalizeRelativePath;
  assert(NormalizeRelativePath("a/b.txt") == "a/b.txt");
  assert(NormalizeRelativePath("./a//b.txt") == "a/b.txt");

  assert(Throws<sitepull::util::ValidationError>([] { (void)NormalizeRelativePath(""); }));
  assert(Throws<sitepull::util::ValidationError>([] { (void)NormalizeRelativePath("/etc/passwd"); }));
  assert(Throws<sitepull::util::ValidationError>([] { (void)NormalizeRelativePath("a/../../etc/passwd"); }));
  assert(Throws<sitepull::util::ValidationError>([] { (void)NormalizeRelativePath("a\\b"); }));
  assert(Throws<sitepull::util::ValidationError>([] { (void)NormalizeRelativePath("./."); }));
  assert(Throws<sitepull::util::ValidationError>([] { (void)NormalizeRelativePath(std::string("a\0b", 3)); }));
}

void TestResolveWithinRoot() {
  TempDir dir("sitepull-scan");
  const auto root = dir.Path() / "site";
  BuildSite(root);
  WriteFile(dir.Path() / "secret.txt", "outside");
  fs::create_symlink(dir.Path() / "secret.txt", root / "escape.txt");

  const auto resolved = ResolveWithinRoot(root, "wp-content/uploads/a.jpg");
  assert(resolved == fs::canonical(root / "wp-content/uploads/a.jpg"));

  assert(Throws<sitepull::util::ValidationError>([&] { (void)ResolveWithinRoot(root, "../secret.txt"); }));
  assert(Throws<sitepull::util::ValidationError>([&] { (void)ResolveWithinRoot(root, "escape.txt"); }));
  assert(Throws<sitepull::util::NotFound>([&] { (void)ResolveWithinRoot(root, "missing.txt"); }));
  assert(Throws<sitepull::util::NotFound>([&] { (void)ResolveWithinRoot(root, "empty-dir"); }));
}

void TestIsWithin() {
  using sitepull::util::IsWithin;
  assert(IsWithin("/srv/site", "/srv/site/a.txt"));
  assert(IsWithin("/srv/site/", "/srv/site/a.txt"));
  assert(!IsWithin("/srv/site", "/srv/site"));
  assert(!IsWithin("/srv/site", "/srv/site2/a.txt"));
  assert(!IsWithin("/srv/site", "/srv"));
}

} // namespace

int main() {
  TestScanListsRegularFilesSorted();
  TestScanRejectsMissingRoot();
  TestNormalizeRelativePath();
  TestResolveWithinRoot();
  TestIsWithin();

  std::cout << "sitepull_unit_scanner: pass\n";
  return 0;
}
