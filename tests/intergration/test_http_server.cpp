#include "csv_reflow/http_server.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <httplib.h>
#include <simdjson.h>

using namespace std::chrono_literals;

static httplib::Result upload(httplib::Client& cli, const std::string& name, const std::string& body,
                              const std::string& delimiter = "|", const std::string& encoding = "") {
  httplib::MultipartFormDataItems items = {
    {"file", body, name, "text/csv"},
    {"delimiter", delimiter, "", ""},
  };
  if (!encoding.empty()) items.push_back({"encoding", encoding, "", ""});
  return cli.Post("/process-csv/", items);
}

static std::string json_field(const std::string& body, const char* key) {
  simdjson::ondemand::parser p;
  simdjson::padded_string json(body);
  simdjson::ondemand::document doc;
  std::string_view v;
  if (p.iterate(json).get(doc) || doc[key].get_string().get(v)) return {};
  return std::string(v);
}

// Status and one JSON field of an error response.
static bool expect_error(const httplib::Result& res, int status, const char* key, const std::string& want,
                         const char* name) {
  if (!res) { std::cerr << "[FAIL] " << name << ": no response\n"; return false; }
  if (res->status != status || json_field(res->body, key) != want) {
    std::cerr << "[FAIL] " << name << ": status=" << res->status << " body=" << res->body << "\n";
    return false;
  }
  return true;
}

static int check_routes(httplib::Client& cli) {
  auto idx = cli.Get("/");
  if (!idx || idx->status != 200 || idx->body.find("/process-csv/") == std::string::npos ||
      idx->body.find("max 4KB") == std::string::npos) {
    std::cerr << "[FAIL] index page\n"; return 1;
  }

  auto ok = upload(cli, "people.csv", "name,age\nAlice,30\n");
  if (!ok || ok->status != 200 ||
      ok->body != "name           |age            \nAlice          |30             \n" ||
      ok->get_header_value("Content-Disposition").find("output.txt") == std::string::npos) {
    std::cerr << "[FAIL] simple upload\n"; return 1;
  }

  // blank delimiter means tab
  auto tab = upload(cli, "people.csv", "name;age\nBo;7\n", "");
  if (!tab || tab->status != 200 || tab->body.find('\t') == std::string::npos) { std::cerr << "[FAIL] tab default\n"; return 1; }

  if (!expect_error(upload(cli, "header.csv", "name,age\n"), 400, "kind", "empty_input", "header only")) return 1;
  if (!expect_error(upload(cli, "notes.txt", "name,age\nAlice,30\n"), 400, "error", "Only CSV files are allowed.", "extension")) return 1;
  if (!expect_error(upload(cli, "big.csv", "v\n" + std::string(5 * 1024, 'x') + "\n"), 413, "error",
                    "File too large. Maximum size allowed is 4KB.", "over limit")) return 1;
  if (!expect_error(upload(cli, "people.csv", "name,age\nAlice,30\n", "#"), 400, "kind", "configuration_invalid", "bad delimiter")) return 1;
  if (!expect_error(upload(cli, "bad.csv", "name,city\nBad\xff,Porto\n"), 400, "kind", "decode_failure", "bad utf-8")) return 1;
  if (!expect_error(upload(cli, "open.csv", "id,text\n1,ok\n2,\"oops\n3,more\n4,rows\n"), 400, "kind", "parse_failure", "open quote")) return 1;

  auto l1 = upload(cli, "bad.csv", "name,city\nBad\xff,Porto\n", "|", "latin-1");
  if (!l1 || l1->status != 200) { std::cerr << "[FAIL] latin-1 upload\n"; return 1; }

  auto cp = upload(cli, "shop.csv", "item,price\r\nCaf\xe9,\x80 4\r\n", "|", "cp1252");
  if (!cp || cp->status != 200 || cp->body.find("Caf\xC3\xA9") == std::string::npos ||
      cp->body.find("\xE2\x82\xAC 4") == std::string::npos) {
    std::cerr << "[FAIL] cp1252 upload\n"; return 1;
  }

  auto nofile = cli.Post("/process-csv/", httplib::MultipartFormDataItems{{"delimiter", "|", "", ""}});
  if (!nofile || nofile->status != 400) { std::cerr << "[FAIL] missing file field\n"; return 1; }

  // statuses httplib produces on its own still carry a JSON body
  if (!expect_error(cli.Get("/nowhere"), 404, "error", "Not found.", "unknown route")) return 1;

  // far past the transport limit: rejected before the handler runs. The server
  // may close the socket while the client is still sending, so only a
  // response that did arrive is checked.
  if (auto res = upload(cli, "huge.csv", "v\n" + std::string(200 * 1024, 'x') + "\n")) {
    if (res->status != 413 || json_field(res->body, "error") != "File too large. Maximum size allowed is 4KB.") {
      std::cerr << "[FAIL] transport limit: status=" << res->status << " body=" << res->body << "\n"; return 1;
    }
  }
  return 0;
}

int main() {
  cr::HttpServer::Config cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cfg.max_upload_bytes = 4 * 1024;
  cfg.quiet = true;

  cr::HttpServer server(cfg);
  if (!server.start()) { std::cerr << "[ERR] bind failed\n"; return 2; }
  const int port = server.bound_port();
  std::thread th([&]{ server.run(); });

  httplib::Client cli("127.0.0.1", port);
  bool up = false;
  for (int i = 0; i < 50 && !up; ++i) {
    if (auto res = cli.Get("/healthz")) up = res->status == 200 && res->body == "ok";
    if (!up) std::this_thread::sleep_for(100ms);
  }

  int rc = 1;
  if (!up) std::cerr << "[FAIL] server did not come up\n";
  else rc = check_routes(cli);

  server.stop();
  th.join();
  if (rc != 0) return rc;
  std::cout << "[PASS] http server\n";
  return 0;
}
