#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include "tether/config.hpp"
#include "tether/entity.hpp"
#include "tether/hash.hpp"
#include "tether/jsonlite.hpp"
#include "tether/offline_queue.hpp"
#include "tether/store.hpp"
#include "tether/sync_engine.hpp"
#include "tether/version.hpp"

namespace {

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

std::string flag_value(int argc, char** argv, int from, const std::string& flag,
                       const std::string& def = "") {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == flag && i + 1 < argc) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, int from, const std::string& flag) {
  for (int i = from; i < argc; ++i) {
    if (std::string(argv[i]) == flag) return true;
  }
  return false;
}

void print_error(const tether::Status& st) {
  std::cout << "{\"ok\":false,\"error\":\"" << tether::to_string(st.code) << "\",\"detail\":\""
            << tether::jsonlite::escape(st.detail) << "\"}\n";
}

void usage() {
  std::cerr << "usage: tether <command>\n"
               "  version\n"
               "  config check --config <file> [--env]\n"
               "  queue inspect --state-dir <dir>\n"
               "  queue compact --state-dir <dir>\n"
               "  state show --state-dir <dir> --entity <id>\n"
               "  journal verify --state-dir <dir>\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];
  const std::string sub = argc >= 3 ? argv[2] : "";
  const std::string default_dir = tether::default_config().state_dir;

  if (cmd == "version") {
    auto m = tether::version::current_manifest();
    std::cout << tether::version::manifest_to_json(m) << "\n";
    return 0;
  }

  if (cmd == "config" && sub == "check") {
    const std::string path = flag_value(argc, argv, 3, "--config");
    tether::ConfigValidationResult parse_result;
    tether::CoordinatorConfig cfg = tether::default_config();
    if (!path.empty()) {
      std::string text;
      if (!read_file(path, &text)) {
        print_error(tether::Status::failure(tether::ErrorCode::config_invalid, "cannot read " + path));
        return 2;
      }
      cfg = tether::config_from_json(text, &parse_result);
    }
    if (has_flag(argc, argv, 3, "--env")) tether::apply_env_overrides(cfg);
    tether::ConfigValidationResult v = tether::validate_config(cfg);
    v.errors.insert(v.errors.begin(), parse_result.errors.begin(), parse_result.errors.end());
    v.warnings.insert(v.warnings.begin(), parse_result.warnings.begin(), parse_result.warnings.end());
    v.ok = v.ok && parse_result.ok;

    tether::jsonlite::Array errors(v.errors.begin(), v.errors.end());
    tether::jsonlite::Array warnings(v.warnings.begin(), v.warnings.end());
    tether::jsonlite::Object out;
    out["ok"]       = v.ok;
    out["errors"]   = std::move(errors);
    out["warnings"] = std::move(warnings);
    std::cout << tether::jsonlite::to_json(tether::jsonlite::Value{out}) << "\n";
    if (v.ok) std::cout << tether::config_to_json(cfg) << "\n";
    return v.ok ? 0 : 2;
  }

  if (cmd == "queue" && (sub == "inspect" || sub == "compact")) {
    tether::FileStateStore store(flag_value(argc, argv, 3, "--state-dir", default_dir));
    tether::OfflineConfig ocfg = tether::default_config().offline;
    tether::OfflineQueueManager queue(store, ocfg, "tether-cli", tether::steady_clock_source());
    tether::Status st = queue.recover();
    if (!st.ok) {
      print_error(st);
      return 2;
    }
    if (sub == "compact") {
      tether::CompactReport c = queue.compact();
      if (!c.ok) {
        print_error(tether::Status::failure(c.code, c.detail));
        return 2;
      }
      std::cout << "{\"ok\":true,\"removed\":" << c.removed << ",\"kept\":" << c.kept << "}\n";
      return 0;
    }
    std::cout << tether::drain_status_to_json(queue.drain_status()) << "\n";
    return 0;
  }

  if (cmd == "state" && sub == "show") {
    const std::string entity_id = flag_value(argc, argv, 3, "--entity");
    if (entity_id.empty()) {
      usage();
      return 1;
    }
    tether::FileStateStore store(flag_value(argc, argv, 3, "--state-dir", default_dir));
    std::optional<tether::EntityRecord> rec;
    tether::Status st = store.load_entity(entity_id, &rec);
    if (!st.ok) {
      print_error(st);
      return 2;
    }
    if (!rec) {
      print_error(tether::Status::failure(tether::ErrorCode::invalid_argument, "no entity " + entity_id));
      return 2;
    }
    tether::Entity e;
    st = tether::entity_from_json(rec->body, &e);
    if (!st.ok) {
      print_error(st);
      return 2;
    }
    auto info = store.entity_info(entity_id);
    tether::jsonlite::Object out;
    out["revision"] = rec->revision;
    out["entity"]   = tether::entity_to_object(e);
    if (info) {
      out["encoding"]    = info->encoding;
      out["stored_size"] = info->stored_size;
      out["digest"]      = info->digest;
    }
    std::cout << tether::jsonlite::to_json(tether::jsonlite::Value{out}) << "\n";
    return 0;
  }

  if (cmd == "journal" && sub == "verify") {
    tether::FileStateStore store(flag_value(argc, argv, 3, "--state-dir", default_dir));
    tether::ConflictJournal journal(store);
    tether::JournalVerifyResult v = journal.verify();
    std::cout << "{\"ok\":" << (v.ok ? "true" : "false") << ",\"entries\":" << v.entries;
    if (!v.ok) {
      std::cout << ",\"first_bad_seq\":" << v.first_bad_seq << ",\"detail\":\""
                << tether::jsonlite::escape(v.detail) << "\"";
    }
    std::cout << "}\n";
    return v.ok ? 0 : 2;
  }

  usage();
  return 1;
}
