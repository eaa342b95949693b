#pragma once

// tether/store.hpp: Durable state behind the offline queue and sync engine.
//
// DESIGN INVARIANTS (every implementation):
//   1. append_log() / append_journal() either persist the whole line or fail;
//      a torn final line (no trailing newline) is dropped on read.
//   2. Entity writes are compare-and-swap on revision. A writer that read
//      revision N may only install revision N+1.
//   3. Entity reads verify a BLAKE3 digest of the snapshot bytes. Any
//      integrity failure returns ErrorCode::storage_corrupt, never bad data.
//   4. rewrite_log() replaces the log atomically (tmp + rename for files).
//
// Layout of FileStateStore under <root>:
//   offline.ndjson            offline operation log
//   conflicts.ndjson          conflict journal
//   entities/AB/<hex>.ent     one canonical entity per file, AB = first two
//                             hex chars of BLAKE3(entity id)
//
// EXTENSION_POINT: remote_state_store
//   A replicated store implements the same interface. Invariant 2 maps to a
//   conditional put keyed on the stored revision.

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tether/types.hpp"

namespace tether {

struct EntityRecord {
  std::string id;
  uint64_t    revision{0};
  std::string body;  // canonical JSON snapshot
};

struct EntityFileInfo {
  std::string id;
  uint64_t    revision{0};
  std::string encoding{"identity"};
  size_t      original_size{0};
  size_t      stored_size{0};
  std::string digest;       // entity_digest(body)
  std::string stored_hash;  // blake3_hex(stored bytes)
};

class IStateStore {
 public:
  virtual ~IStateStore() = default;

  virtual Status append_log(const std::string& line) = 0;
  virtual Status read_log(std::vector<std::string>* lines) const = 0;
  virtual Status rewrite_log(const std::vector<std::string>& lines) = 0;

  // *out is nullopt when the entity does not exist yet.
  virtual Status load_entity(const std::string& id, std::optional<EntityRecord>* out) const = 0;

  // Installs body at expected_revision + 1. Fails with version_mismatch when
  // the stored revision differs from expected_revision (0 = must not exist).
  virtual Status store_entity(const std::string& id, uint64_t expected_revision,
                              const std::string& body) = 0;

  virtual std::vector<std::string> list_entities() const = 0;

  virtual Status append_journal(const std::string& line) = 0;
  virtual Status read_journal(std::vector<std::string>* lines) const = 0;

  virtual std::string backend_id() const = 0;
};

class FileStateStore : public IStateStore {
 public:
  // compress: store entity snapshots with zstd when built with TETHER_WITH_ZSTD.
  explicit FileStateStore(std::string root, bool compress = true);

  Status append_log(const std::string& line) override;
  Status read_log(std::vector<std::string>* lines) const override;
  Status rewrite_log(const std::vector<std::string>& lines) override;
  Status load_entity(const std::string& id, std::optional<EntityRecord>* out) const override;
  Status store_entity(const std::string& id, uint64_t expected_revision,
                      const std::string& body) override;
  std::vector<std::string> list_entities() const override;
  Status append_journal(const std::string& line) override;
  Status read_journal(std::vector<std::string>* lines) const override;
  std::string backend_id() const override { return "local_fs"; }

  std::string log_path() const;
  std::string journal_path() const;
  std::string entity_path(const std::string& id) const;
  std::optional<EntityFileInfo> entity_info(const std::string& id) const;

  const std::string& root() const { return root_; }

 private:
  Status load_entity_locked(const std::string& id, std::optional<EntityRecord>* out) const;

  std::string root_;
  bool compress_;
  mutable std::mutex mu_;
};

class MemoryStateStore : public IStateStore {
 public:
  Status append_log(const std::string& line) override;
  Status read_log(std::vector<std::string>* lines) const override;
  Status rewrite_log(const std::vector<std::string>& lines) override;
  Status load_entity(const std::string& id, std::optional<EntityRecord>* out) const override;
  Status store_entity(const std::string& id, uint64_t expected_revision,
                      const std::string& body) override;
  std::vector<std::string> list_entities() const override;
  Status append_journal(const std::string& line) override;
  Status read_journal(std::vector<std::string>* lines) const override;
  std::string backend_id() const override { return "memory"; }

  // Fault injection for tests.
  void set_fail_writes(bool fail);
  void corrupt_entity(const std::string& id);

 private:
  struct Slot {
    uint64_t    revision{0};
    std::string body;
    std::string digest;
  };
  mutable std::mutex mu_;
  std::vector<std::string> log_;
  std::vector<std::string> journal_;
  std::map<std::string, Slot> entities_;
  bool fail_writes_{false};
};

}  // namespace tether
