#ifndef MANAGER_SESSION_STORE_HPP
#define MANAGER_SESSION_STORE_HPP

#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/event.pb.h"
#include "proto/ledger.pb.h"
#include "proto/session.pb.h"

namespace manager {

// Persistent storage of sessions. Every method is thread-safe; methods that
// take the id of a missing session throw std::out_of_range.
class SessionStore {
 public:
  virtual absl::optional<proto::StoredSession> Load(const std::string& id) = 0;
  virtual bool Exists(const std::string& id) = 0;
  // Creates an empty session, or does nothing if it already exists.
  virtual void Create(const std::string& id, const std::string& title) = 0;
  virtual void Append(const std::string& id,
                      const proto::StoredMessage& message) = 0;
  // Adds the cost of a run to the totals of the session.
  virtual void UpdateTotals(const std::string& id, int64_t tokens,
                            double cost) = 0;

  SessionStore() = default;
  virtual ~SessionStore() = default;
  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;
  SessionStore(SessionStore&&) = delete;
  SessionStore& operator=(SessionStore&&) = delete;
};

// One JSON document per session in a directory, rewritten atomically on every
// change. Session ids may only contain letters, digits, '-' and '_'.
class FileSessionStore : public SessionStore {
 public:
  explicit FileSessionStore(std::string directory);

  absl::optional<proto::StoredSession> Load(const std::string& id) override;
  bool Exists(const std::string& id) override;
  void Create(const std::string& id, const std::string& title) override;
  void Append(const std::string& id,
              const proto::StoredMessage& message) override;
  void UpdateTotals(const std::string& id, int64_t tokens,
                    double cost) override;

 private:
  std::string PathOf(const std::string& id) const;
  absl::optional<proto::StoredSession> LoadLocked(const std::string& id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  proto::StoredSession LoadExistingLocked(const std::string& id)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  void StoreLocked(const proto::StoredSession& session)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  std::string directory_;
  absl::Mutex mutex_;
};

// Writes the events of one run to a session: the user query first, then every
// event in order, then the cost of the run added to the session totals.
class SessionRecorder {
 public:
  static const constexpr size_t kMaxTitleLength = 200;

  // Creates the session if it does not exist yet, and records the query.
  SessionRecorder(SessionStore* store, std::string session_id,
                  const std::string& task);

  // run_started is not stored.
  void Record(const proto::Event& event);
  void Finish(const proto::CostLedger& ledger);

  const std::string& SessionId() const { return session_id_; }

 private:
  SessionStore* store_;
  std::string session_id_;
  int64_t next_index_ = 0;
};

}  // namespace manager

#endif
