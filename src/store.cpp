#include "tether/store.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#if defined(TETHER_WITH_ZSTD)
#include <zstd.h>
#endif

#include "tether/hash.hpp"
#include "tether/jsonlite.hpp"
#include "tether/observability.hpp"
#include "tether/version.hpp"

namespace fs = std::filesystem;

namespace tether {

namespace {

#if defined(TETHER_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n)) return std::nullopt;
  out.resize(n);
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return (dir / (".tmp_" + std::to_string(rng()))).string();
}

// tmp + rename; rename() is atomic within one filesystem.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

Status append_line(const std::string& path, const std::string& line) {
  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  const auto size = fs::exists(path, ec) ? fs::file_size(path, ec) : 0;
  if (!ec && size > 0) {
    std::ifstream ifs(path, std::ios::binary);
    char last = '\n';
    ifs.seekg(-1, std::ios::end);
    ifs.get(last);
    if (ifs && last != '\n') {
      ifs.clear();
      ifs.seekg(0);
      std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
      // Cut the torn record so the new line starts on a record boundary.
      const size_t nl = content.rfind('\n');
      fs::resize_file(path, nl == std::string::npos ? 0 : nl + 1, ec);
      if (ec) return Status::failure(ErrorCode::storage_corrupt, "cannot truncate torn record in " + path);
    }
  }
  FILE* f = std::fopen(path.c_str(), "ab");
  if (!f) return Status::failure(ErrorCode::storage_corrupt, "cannot open " + path);
  const std::string rec = line + "\n";
  const size_t n = std::fwrite(rec.data(), 1, rec.size(), f);
  const bool flushed = std::fflush(f) == 0;
  std::fclose(f);
  if (n != rec.size() || !flushed) {
    return Status::failure(ErrorCode::storage_corrupt, "short write to " + path);
  }
  return Status::success();
}

Status read_lines(const std::string& path, std::vector<std::string>* lines) {
  lines->clear();
  if (!fs::exists(path)) return Status::success();
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return Status::failure(ErrorCode::storage_corrupt, "cannot read " + path);
  std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  size_t start = 0;
  while (start < content.size()) {
    const size_t nl = content.find('\n', start);
    if (nl == std::string::npos) {
      // Torn final append: the writer never acknowledged it.
      log_warning("store", "dropping unterminated trailing record in " + path);
      break;
    }
    if (nl > start) lines->push_back(content.substr(start, nl - start));
    start = nl + 1;
  }
  return Status::success();
}

std::string meta_line(const EntityFileInfo& info) {
  jsonlite::Object o;
  o["format"]        = version::ENTITY_FORMAT_VERSION;
  o["id"]            = info.id;
  o["revision"]      = info.revision;
  o["encoding"]      = info.encoding;
  o["original_size"] = static_cast<uint64_t>(info.original_size);
  o["stored_size"]   = static_cast<uint64_t>(info.stored_size);
  o["digest"]        = info.digest;
  o["stored_hash"]   = info.stored_hash;
  return jsonlite::to_json(jsonlite::Value{o});
}

Status parse_entity_file(const std::string& path, EntityFileInfo* info, std::string* stored) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return Status::failure(ErrorCode::storage_corrupt, "cannot read " + path);
  std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  const size_t nl = content.find('\n');
  if (nl == std::string::npos) {
    return Status::failure(ErrorCode::storage_corrupt, "entity file without header: " + path);
  }
  std::optional<jsonlite::JsonError> err;
  auto meta = jsonlite::parse(content.substr(0, nl), &err);
  if (err) return Status::failure(ErrorCode::storage_corrupt, "entity header: " + err->message);
  const auto fmt = static_cast<uint32_t>(jsonlite::get_u64(meta, "format"));
  auto compat = version::check_format("entity", fmt, version::ENTITY_FORMAT_VERSION);
  if (!compat.ok) return Status::failure(ErrorCode::storage_corrupt, compat.description);

  info->id            = jsonlite::get_string(meta, "id");
  info->revision      = jsonlite::get_u64(meta, "revision");
  info->encoding      = jsonlite::get_string(meta, "encoding", "identity");
  info->original_size = jsonlite::get_u64(meta, "original_size");
  info->stored_size   = jsonlite::get_u64(meta, "stored_size");
  info->digest        = jsonlite::get_string(meta, "digest");
  info->stored_hash   = jsonlite::get_string(meta, "stored_hash");
  *stored = content.substr(nl + 1);
  return Status::success();
}

}  // namespace

// ---------------------------------------------------------------------------
// FileStateStore
// ---------------------------------------------------------------------------

FileStateStore::FileStateStore(std::string root, bool compress)
    : root_(std::move(root)), compress_(compress) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "entities", ec);
}

std::string FileStateStore::log_path() const {
  return (fs::path(root_) / "offline.ndjson").string();
}

std::string FileStateStore::journal_path() const {
  return (fs::path(root_) / "conflicts.ndjson").string();
}

std::string FileStateStore::entity_path(const std::string& id) const {
  const std::string h = blake3_hex(id);
  return (fs::path(root_) / "entities" / h.substr(0, 2) / (h + ".ent")).string();
}

Status FileStateStore::append_log(const std::string& line) {
  std::lock_guard<std::mutex> lk(mu_);
  return append_line(log_path(), line);
}

Status FileStateStore::read_log(std::vector<std::string>* lines) const {
  std::lock_guard<std::mutex> lk(mu_);
  return read_lines(log_path(), lines);
}

Status FileStateStore::rewrite_log(const std::vector<std::string>& lines) {
  std::string data;
  for (const auto& l : lines) {
    data += l;
    data += '\n';
  }
  std::lock_guard<std::mutex> lk(mu_);
  if (!atomic_write(log_path(), data)) {
    return Status::failure(ErrorCode::storage_corrupt, "cannot rewrite " + log_path());
  }
  return Status::success();
}

Status FileStateStore::load_entity(const std::string& id, std::optional<EntityRecord>* out) const {
  std::lock_guard<std::mutex> lk(mu_);
  return load_entity_locked(id, out);
}

Status FileStateStore::load_entity_locked(const std::string& id,
                                          std::optional<EntityRecord>* out) const {
  out->reset();
  const std::string path = entity_path(id);
  if (!fs::exists(path)) return Status::success();

  EntityFileInfo info;
  std::string stored;
  Status st = parse_entity_file(path, &info, &stored);
  if (!st.ok) return st;

  if (info.id != id) {
    return Status::failure(ErrorCode::storage_corrupt, "entity file holds '" + info.id + "', expected '" + id + "'");
  }
  if (blake3_hex(stored) != info.stored_hash) {
    return Status::failure(ErrorCode::storage_corrupt, "stored hash mismatch for entity " + id);
  }

  std::string body = stored;
  if (info.encoding == "zstd") {
#if defined(TETHER_WITH_ZSTD)
    auto d = decompress_zstd(stored, info.original_size);
    if (!d) return Status::failure(ErrorCode::storage_corrupt, "zstd decode failed for entity " + id);
    body = std::move(*d);
#else
    return Status::failure(ErrorCode::storage_corrupt,
                           "entity " + id + " is zstd-encoded but zstd support is not built in");
#endif
  } else if (info.encoding != "identity") {
    return Status::failure(ErrorCode::storage_corrupt, "unknown encoding '" + info.encoding + "'");
  }

  if (entity_digest(body) != info.digest) {
    return Status::failure(ErrorCode::storage_corrupt, "digest mismatch for entity " + id);
  }
  *out = EntityRecord{id, info.revision, std::move(body)};
  return Status::success();
}

Status FileStateStore::store_entity(const std::string& id, uint64_t expected_revision,
                                    const std::string& body) {
  std::lock_guard<std::mutex> lk(mu_);
  std::optional<EntityRecord> current;
  Status st = load_entity_locked(id, &current);
  if (!st.ok) return st;
  const uint64_t have = current ? current->revision : 0;
  if (have != expected_revision) {
    return Status::failure(ErrorCode::version_mismatch,
                           "entity " + id + " at revision " + std::to_string(have) +
                               ", writer expected " + std::to_string(expected_revision));
  }

  EntityFileInfo info;
  info.id            = id;
  info.revision      = expected_revision + 1;
  info.original_size = body.size();
  info.digest        = entity_digest(body);

  std::string stored = body;
#if defined(TETHER_WITH_ZSTD)
  if (compress_) {
    auto c = compress_zstd(body);
    if (!c.empty()) {
      stored        = std::move(c);
      info.encoding = "zstd";
    }
  }
#else
  (void)compress_;
#endif
  info.stored_size = stored.size();
  info.stored_hash = blake3_hex(stored);

  if (!atomic_write(entity_path(id), meta_line(info) + "\n" + stored)) {
    return Status::failure(ErrorCode::storage_corrupt, "cannot write entity " + id);
  }
  return Status::success();
}

std::optional<EntityFileInfo> FileStateStore::entity_info(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  const std::string path = entity_path(id);
  if (!fs::exists(path)) return std::nullopt;
  EntityFileInfo info;
  std::string stored;
  if (!parse_entity_file(path, &info, &stored).ok) return std::nullopt;
  return info;
}

std::vector<std::string> FileStateStore::list_entities() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  const fs::path dir = fs::path(root_) / "entities";
  std::error_code ec;
  if (!fs::exists(dir, ec)) return out;
  for (const auto& entry : fs::recursive_directory_iterator(dir, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".ent") continue;
    EntityFileInfo info;
    std::string stored;
    if (parse_entity_file(entry.path().string(), &info, &stored).ok && !info.id.empty()) {
      out.push_back(info.id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

Status FileStateStore::append_journal(const std::string& line) {
  std::lock_guard<std::mutex> lk(mu_);
  return append_line(journal_path(), line);
}

Status FileStateStore::read_journal(std::vector<std::string>* lines) const {
  std::lock_guard<std::mutex> lk(mu_);
  return read_lines(journal_path(), lines);
}

// ---------------------------------------------------------------------------
// MemoryStateStore
// ---------------------------------------------------------------------------

Status MemoryStateStore::append_log(const std::string& line) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_writes_) return Status::failure(ErrorCode::storage_corrupt, "injected write failure");
  log_.push_back(line);
  return Status::success();
}

Status MemoryStateStore::read_log(std::vector<std::string>* lines) const {
  std::lock_guard<std::mutex> lk(mu_);
  *lines = log_;
  return Status::success();
}

Status MemoryStateStore::rewrite_log(const std::vector<std::string>& lines) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_writes_) return Status::failure(ErrorCode::storage_corrupt, "injected write failure");
  log_ = lines;
  return Status::success();
}

Status MemoryStateStore::load_entity(const std::string& id, std::optional<EntityRecord>* out) const {
  std::lock_guard<std::mutex> lk(mu_);
  out->reset();
  auto it = entities_.find(id);
  if (it == entities_.end()) return Status::success();
  if (entity_digest(it->second.body) != it->second.digest) {
    return Status::failure(ErrorCode::storage_corrupt, "digest mismatch for entity " + id);
  }
  *out = EntityRecord{id, it->second.revision, it->second.body};
  return Status::success();
}

Status MemoryStateStore::store_entity(const std::string& id, uint64_t expected_revision,
                                      const std::string& body) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_writes_) return Status::failure(ErrorCode::storage_corrupt, "injected write failure");
  auto it = entities_.find(id);
  const uint64_t have = it == entities_.end() ? 0 : it->second.revision;
  if (have != expected_revision) {
    return Status::failure(ErrorCode::version_mismatch,
                           "entity " + id + " at revision " + std::to_string(have));
  }
  entities_[id] = Slot{expected_revision + 1, body, entity_digest(body)};
  return Status::success();
}

std::vector<std::string> MemoryStateStore::list_entities() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& [id, slot] : entities_) out.push_back(id);
  return out;
}

Status MemoryStateStore::append_journal(const std::string& line) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_writes_) return Status::failure(ErrorCode::storage_corrupt, "injected write failure");
  journal_.push_back(line);
  return Status::success();
}

Status MemoryStateStore::read_journal(std::vector<std::string>* lines) const {
  std::lock_guard<std::mutex> lk(mu_);
  *lines = journal_;
  return Status::success();
}

void MemoryStateStore::set_fail_writes(bool fail) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_writes_ = fail;
}

void MemoryStateStore::corrupt_entity(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entities_.find(id);
  if (it != entities_.end()) it->second.body += " ";
}

}  // namespace tether
