#include "archive_builder.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sitepull::archive {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t   kBlock       = 512;
constexpr std::uint64_t kMaxOctal11  = 077777777777ull;
constexpr std::size_t   kNameSize    = 100;
constexpr std::size_t   kPrefixSize  = 155;
constexpr std::size_t   kCopyBuffer  = 64 * 1024;

struct Entry {
  std::string   name;
  fs::path      path;
  std::uint64_t size = 0;
};

void WriteOctal(char* field, std::size_t width, std::uint64_t value) {
  // width-1 digits followed by NUL
  std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1), static_cast<unsigned long long>(value));
}

void SplitName(const std::string& name, char* header) {
  if (name.size() <= kNameSize) {
    std::memcpy(header, name.data(), name.size());
    return;
  }

  // rightmost '/' that leaves both halves within their fields
  for (auto pos = name.rfind('/'); pos != std::string::npos && pos > 0; pos = name.rfind('/', pos - 1)) {
    const auto tail = name.size() - pos - 1;
    if (tail > kNameSize) break;
    if (pos <= kPrefixSize && tail > 0) {
      std::memcpy(header, name.data() + pos + 1, tail);
      std::memcpy(header + 345, name.data(), pos);
      return;
    }
  }
  throw util::StorageError("path too long for ustar: " + name);
}

std::array<char, kBlock> MakeHeader(const Entry& entry) {
  if (entry.size > kMaxOctal11) {
    throw util::StorageError("file too large for ustar: " + entry.name);
  }

  std::array<char, kBlock> header{};
  SplitName(entry.name, header.data());
  WriteOctal(header.data() + 100, 8, 0644);
  WriteOctal(header.data() + 108, 8, 0);
  WriteOctal(header.data() + 116, 8, 0);
  WriteOctal(header.data() + 124, 12, entry.size);
  WriteOctal(header.data() + 136, 12, 0);
  header[156] = '0';
  std::memcpy(header.data() + 257, "ustar", 6);
  std::memcpy(header.data() + 263, "00", 2);

  std::memset(header.data() + 148, ' ', 8);
  unsigned int sum = 0;
  for (char c : header) sum += static_cast<unsigned char>(c);
  std::snprintf(header.data() + 148, 7, "%06o", sum);
  header[154] = '\0';
  header[155] = ' ';
  return header;
}

std::vector<Entry> CollectEntries(const fs::path& source_dir) {
  std::vector<Entry> entries;
  std::error_code    ec;

  fs::recursive_directory_iterator it(source_dir, ec);
  if (ec) throw util::StorageError("cannot read " + source_dir.string() + ": " + ec.message());

  for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
    if (ec) throw util::StorageError("cannot read " + source_dir.string() + ": " + ec.message());
    if (it->is_symlink(ec) || !it->is_regular_file(ec)) continue;

    Entry entry;
    entry.path = it->path();
    entry.name = fs::relative(it->path(), source_dir, ec).generic_string();
    entry.size = it->file_size(ec);
    if (ec) throw util::StorageError("cannot stat " + it->path().string() + ": " + ec.message());
    entries.push_back(std::move(entry));
  }

  std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return a.name < b.name; });
  return entries;
}

void WriteEntry(std::ofstream& out, const Entry& entry) {
  const auto header = MakeHeader(entry);
  out.write(header.data(), kBlock);

  std::ifstream in(entry.path, std::ios::binary);
  if (!in) throw util::StorageError("cannot open " + entry.path.string());

  std::vector<char> buffer(kCopyBuffer);
  std::uint64_t     copied = 0;
  while (copied < entry.size) {
    const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), entry.size - copied));
    in.read(buffer.data(), want);
    if (in.gcount() != want) throw util::StorageError("file changed while archiving: " + entry.path.string());
    out.write(buffer.data(), want);
    copied += static_cast<std::uint64_t>(want);
  }

  static const std::array<char, kBlock> kZeros{};
  const auto pad = (kBlock - entry.size % kBlock) % kBlock;
  out.write(kZeros.data(), static_cast<std::streamsize>(pad));
  if (!out) throw util::StorageError("write failed while archiving " + entry.name);
}

} // namespace

void TarArchiveBuilder::Build(const fs::path& source_dir, const fs::path& archive_path) {
  const auto entries = CollectEntries(source_dir);

  std::error_code ec;
  fs::create_directories(archive_path.parent_path(), ec);
  if (ec) throw util::StorageError("cannot create " + archive_path.parent_path().string() + ": " + ec.message());

  try {
    std::ofstream out(archive_path, std::ios::binary | std::ios::trunc);
    if (!out) throw util::StorageError("cannot create archive " + archive_path.string());

    for (const auto& entry : entries) WriteEntry(out, entry);

    static const std::array<char, kBlock * 2> kTrailer{};
    out.write(kTrailer.data(), kTrailer.size());
    out.close();
    if (out.fail()) throw util::StorageError("cannot finish archive " + archive_path.string());
  } catch (const util::StorageError&) {
    fs::remove(archive_path, ec);
    throw;
  }

  SITEPULL_LOG_INFO("archive written", {observability::StringField("path", archive_path.string()),
                                        observability::IntField("entries", static_cast<std::int64_t>(entries.size()))});
}

} // namespace sitepull::archive
