#include "internal/archive/archive_builder.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "support/tar_reader.hpp"
#include "support/temp_dir.hpp"

namespace {

namespace fs = std::filesystem;
using sitepull::archive::TarArchiveBuilder;
using sitepull::testing::ReadFile;
using sitepull::testing::ReadTar;
using sitepull::testing::TempDir;
using sitepull::testing::WriteFile;

const std::string kLongDir = std::string(60, 'd') + "/" + std::string(60, 'e');

void BuildTree(const fs::path& root) {
  WriteFile(root / "database.sql", "-- sitepull SQL export\n");
  WriteFile(root / "files/index.php", "<?php");
  WriteFile(root / "files/empty", "");
  WriteFile(root / "files/blocks.bin", std::string(1024, 'b'));
  WriteFile(root / "files" / kLongDir / "long-name.txt", "deep");
}

void TestArchiveContents() {
  TempDir dir("sitepull-archive");
  BuildTree(dir.Path() / "work");
  fs::create_symlink(dir.Path() / "work/database.sql", dir.Path() / "work/files/link.sql");

  const auto archive = dir.Path() / "out/site.tar";
  TarArchiveBuilder().Build(dir.Path() / "work", archive);

  const auto bytes = ReadFile(archive);
  assert(bytes.size() % 512 == 0);
  // two zero blocks close the archive
  assert(bytes.substr(bytes.size() - 1024) == std::string(1024, '\0'));

  const auto members = ReadTar(archive);
  assert(members.size() == 5);
  assert(members.at("database.sql") == "-- sitepull SQL export\n");
  assert(members.at("files/index.php") == "<?php");
  assert(members.at("files/empty").empty());
  assert(members.at("files/blocks.bin") == std::string(1024, 'b'));
  assert(members.at("files/" + kLongDir + "/long-name.txt") == "deep");
  assert(!members.count("files/link.sql"));

  // sorted order, first member is database.sql
  assert(std::string(bytes.data(), 12) == "database.sql");
  assert(std::string(bytes.data() + 257, 5) == "ustar");
}

void TestHeaderChecksum() {
  TempDir dir("sitepull-archive");
  WriteFile(dir.Path() / "work/a.txt", "abc");
  TarArchiveBuilder().Build(dir.Path() / "work", dir.Path() / "a.tar");

  const auto bytes = ReadFile(dir.Path() / "a.tar");
  unsigned   sum   = 0;
  for (std::size_t i = 0; i < 512; ++i) {
    sum += (i >= 148 && i < 156) ? static_cast<unsigned>(' ') : static_cast<unsigned char>(bytes[i]);
  }
  assert(std::strtoul(bytes.substr(148, 6).c_str(), nullptr, 8) == sum);
  assert(bytes.substr(100, 7) == "0000644");
  assert(bytes.substr(136, 11) == "00000000000");
}

void TestIdenticalTreesGiveIdenticalArchives() {
  TempDir dir("sitepull-archive");
  BuildTree(dir.Path() / "one");
  BuildTree(dir.Path() / "two");
  fs::last_write_time(dir.Path() / "two/files/index.php", fs::file_time_type::clock::now() - std::chrono::hours(48));

  TarArchiveBuilder builder;
  builder.Build(dir.Path() / "one", dir.Path() / "one.tar");
  builder.Build(dir.Path() / "two", dir.Path() / "two.tar");
  assert(ReadFile(dir.Path() / "one.tar") == ReadFile(dir.Path() / "two.tar"));
}

void TestUnrepresentablePathLeavesNoArchive() {
  TempDir dir("sitepull-archive");
  WriteFile(dir.Path() / "work" / std::string(120, 'n'), "x");

  bool threw = false;
  try {
    TarArchiveBuilder().Build(dir.Path() / "work", dir.Path() / "bad.tar");
  } catch (const sitepull::util::StorageError&) {
    threw = true;
  }
  assert(threw);
  assert(!fs::exists(dir.Path() / "bad.tar"));
}

void TestMissingSourceIsStorageError() {
  TempDir dir("sitepull-archive");
  bool    threw = false;
  try {
    TarArchiveBuilder().Build(dir.Path() / "absent", dir.Path() / "x.tar");
  } catch (const sitepull::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestArchiveContents();
  TestHeaderChecksum();
  TestIdenticalTreesGiveIdenticalArchives();
  TestUnrepresentablePathLeavesNoArchive();
  TestMissingSourceIsStorageError();

  std::cout << "sitepull_unit_archive_builder: pass\n";
  return 0;
}
