#include <fstream>
#include <iostream>
#include <string>

#include "client/cpp/sitepull_client.h"
#include "sitepull/v1.hpp"

// Pulls a full SQL dump through the stateless cursor protocol and writes it
// to a file. The cursor returned by each call is handed back unchanged.
int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "Usage: export_stream_example <endpoint> <access_key> <out.sql>\n";
    return 1;
  }

  try {
    auto transport = sitepull::client::GrpcTransport::Connect(argv[1], sitepull::client::ClientOptions{argv[2]});

    sitepull::v1::InitStreamRequest init_request;
    init_request.set_chunk_size(1000);
    auto init = transport->InitStream(init_request);

    std::ofstream out(argv[3], std::ios::binary | std::ios::trunc);
    out << init.preamble();

    std::cout << "tables: " << init.metadata().total_tables() << " rows: ~" << init.metadata().total_rows() << '\n';

    std::string cursor   = init.cursor();
    bool        complete = init.metadata().total_tables() == 0;
    while (!complete) {
      sitepull::v1::NextChunkRequest next;
      next.set_cursor(cursor);
      next.set_time_budget_ms(2000);

      auto step = transport->NextChunk(next);
      out << step.slice();
      cursor   = step.cursor();
      complete = step.is_complete();

      std::cout << step.progress().current_table() << ": " << step.progress().rows_in_chunk() << " rows, chunk "
                << step.performance().chunk_size_used() << '\n';
    }

    if (!out.flush()) {
      std::cerr << "write failed: " << argv[3] << '\n';
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "export failed: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
