#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <sqlite3.h>

#include "client/cpp/sitepull_client.h"
#include "internal/config/defaults.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/factory.hpp"
#include "internal/orchestrator/download_orchestrator.hpp"
#include "internal/runtime/server.hpp"
#include "support/tar_reader.hpp"
#include "support/temp_dir.hpp"

namespace {

namespace fs = std::filesystem;
using sitepull::db::sqlite::SqliteDB;
using sitepull::orchestrator::DownloadRequest;
using sitepull::testing::TempDir;
using sitepull::testing::WriteFile;

constexpr int kPosts = 750;

void SeedSite(const fs::path& db_path, const fs::path& root) {
  SqliteDB db(db_path.string());
  db.Exec("CREATE TABLE options (name TEXT PRIMARY KEY, value TEXT);");
  db.Exec("CREATE TABLE posts (id INTEGER PRIMARY KEY, title TEXT NOT NULL, body BLOB);");
  db.Exec("CREATE TABLE term_relationships (object_id INTEGER, term_id INTEGER, PRIMARY KEY (object_id, term_id));");
  db.Exec("INSERT INTO options VALUES ('siteurl', 'https://example.com'), ('blogname', 'It''s a blog');");
  db.Exec("BEGIN;");
  for (int i = 1; i <= kPosts; ++i) {
    db.Exec("INSERT INTO posts VALUES (" + std::to_string(i) + ", 'post " + std::to_string(i) + "', X'0001FF');");
  }
  db.Exec("COMMIT;");
  db.Exec("INSERT INTO term_relationships VALUES (1, 1), (1, 2), (2, 1);");

  WriteFile(root / "index.php", "<?php require 'wp-blog-header.php';\n");
  WriteFile(root / "wp-config.php", "<?php define('DB_NAME', 'site');\n");
  WriteFile(root / "wp-content/themes/site/style.css", "body { margin: 0; }\n");
  WriteFile(root / "wp-content/uploads/2024/photo.jpg", std::string(20000, '\x7f'));
  WriteFile(root / "wp-content/uploads/2024/empty.txt", "");
}

sitepull::runtime::config::RuntimeConfig ServerConfig(const TempDir& dir) {
  sitepull::runtime::config::RuntimeConfig config;
  sitepull::config::ApplyDefaults(&config);
  config.mutable_server()->set_bind_address("127.0.0.1:0");
  config.mutable_server()->set_access_key("s3cret");
  config.mutable_server()->set_source_root((dir.Path() / "site").string());
  config.mutable_server()->set_spool_dir((dir.Path() / "spool").string());
  config.mutable_database()->mutable_sqlite()->set_path((dir.Path() / "site.db").string());
  config.mutable_exporter()->set_default_chunk_size(200);
  config.mutable_job_store()->set_entries_per_chunk(2);
  return config;
}

sitepull::runtime::config::ClientConfig Client() {
  sitepull::runtime::config::RuntimeConfig config;
  sitepull::config::ApplyDefaults(&config);
  auto client = config.client();
  client.set_large_file_threshold_bytes(4096);
  client.set_batch_count_cap(2);
  client.set_manifest_page_size(3);
  client.mutable_retry_backoff()->set_nanos(1000000);
  client.mutable_pacing_delay()->set_nanos(1000000);
  return client;
}

std::shared_ptr<sitepull::transfer::Transport> Connect(const DownloadRequest& request) {
  return sitepull::client::GrpcTransport::Connect(request.url, sitepull::client::ClientOptions{request.access_key, std::chrono::seconds(10)});
}

std::int64_t CountRows(SqliteDB& db, const std::string& table) {
  auto st = db.Prepare("SELECT COUNT(*) FROM " + table + ";");
  assert(sqlite3_step(st.get()) == SQLITE_ROW);
  return sqlite3_column_int64(st.get(), 0);
}

fs::path OnlyArchive(const fs::path& output) {
  fs::path found;
  std::size_t count = 0;
  for (const auto& entry : fs::directory_iterator(output / "archives")) {
    if (entry.path().extension() == ".tar") {
      found = entry.path();
      ++count;
    }
  }
  assert(count == 1);
  return found;
}

void TestPullOverGrpc() {
  TempDir dir("sitepull-e2e");
  SeedSite(dir.Path() / "site.db", dir.Path() / "site");

  const auto config = ServerConfig(dir);
  auto       app    = sitepull::factory::Build(config);

  sitepull::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
  server.Start();
  assert(server.SelectedPort() > 0);

  const std::string url    = "http://127.0.0.1:" + std::to_string(server.SelectedPort()) + "/";
  const auto        output = dir.Path() / "out";
  const auto        client = Client();

  {
    std::ostringstream out;
    const int code = sitepull::orchestrator::HandleDownload(DownloadRequest{url, "s3cret", output, 3}, client, Connect, out);
    assert(code == sitepull::orchestrator::kExitOk);
    assert(out.str().find("files: 5/5") != std::string::npos);

    const auto members = sitepull::testing::ReadTar(OnlyArchive(output));
    assert(members.size() == 6);
    assert(members.at("files/index.php") == "<?php require 'wp-blog-header.php';\n");
    assert(members.at("files/wp-content/uploads/2024/photo.jpg") == std::string(20000, '\x7f'));
    assert(members.at("files/wp-content/uploads/2024/empty.txt").empty());
    assert(members.count("files/wp-content/themes/site/style.css") == 1);

    SqliteDB replica((dir.Path() / "replica.db").string());
    replica.Exec(members.at("database.sql"));
    assert(CountRows(replica, "options") == 2);
    assert(CountRows(replica, "posts") == kPosts);
    assert(CountRows(replica, "term_relationships") == 3);

    auto st = replica.Prepare("SELECT value FROM options WHERE name = 'blogname';");
    assert(sqlite3_step(st.get()) == SQLITE_ROW);
    assert(std::string(reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 0))) == "It's a blog");
  }

  {
    std::ostringstream out;
    const int code = sitepull::orchestrator::HandleDownload(DownloadRequest{url, "wrong", dir.Path() / "denied", 2}, client, Connect, out);
    assert(code == sitepull::orchestrator::kExitTransfer);
    assert(out.str().rfind("transfer failed: ", 0) == 0);
  }

  // the finished job released its spool file
  for (const auto& entry : fs::directory_iterator(dir.Path() / "spool")) {
    assert(entry.path().extension() != ".sql");
  }

  server.Stop();
  for (auto& worker : app.background_workers) worker->Stop();
}

} // namespace

int main() {
  TestPullOverGrpc();

  std::cout << "sitepull_integration_end_to_end: pass\n";
  return 0;
}
