#include "manager/session_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "manager/records.hpp"
#include "util/file.hpp"

namespace manager {

namespace {
void CheckId(const std::string& id) {
  if (id.empty()) throw std::invalid_argument("Empty session id");
  for (char c : id) {
    if (!absl::ascii_isalnum(c) && c != '-' && c != '_') {
      throw std::invalid_argument(absl::StrCat("Invalid session id: ", id));
    }
  }
}

// Longest prefix of at most max_bytes that does not split a UTF-8 sequence.
std::string Utf8Prefix(const std::string& text, size_t max_bytes) {
  if (text.size() <= max_bytes) return text;
  size_t end = max_bytes;
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
    end--;
  }
  return text.substr(0, end);
}
}  // namespace

FileSessionStore::FileSessionStore(std::string directory)
    : directory_(std::move(directory)) {
  util::File::MakeDirs(directory_);
}

std::string FileSessionStore::PathOf(const std::string& id) const {
  CheckId(id);
  return util::File::JoinPath(directory_, id + ".json");
}

absl::optional<proto::StoredSession> FileSessionStore::LoadLocked(
    const std::string& id) {
  std::string path = PathOf(id);
  if (!util::File::Exists(path)) return {};
  std::string json;
  util::File::Read(path, [&json](const char* data, size_t size) {
    json.append(data, size);
  });
  proto::StoredSession session;
  auto status = google::protobuf::util::JsonStringToMessage(json, &session);
  if (!status.ok()) {
    throw std::runtime_error(
        absl::StrCat("Corrupted session ", path, ": ", status.ToString()));
  }
  return session;
}

proto::StoredSession FileSessionStore::LoadExistingLocked(
    const std::string& id) {
  absl::optional<proto::StoredSession> session = LoadLocked(id);
  if (!session) throw std::out_of_range(absl::StrCat("No such session: ", id));
  return *std::move(session);
}

void FileSessionStore::StoreLocked(const proto::StoredSession& session) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(session, &json, options);
  if (!status.ok()) {
    throw std::runtime_error(absl::StrCat("Cannot serialize session ",
                                          session.session_id(), ": ",
                                          status.ToString()));
  }
  util::File::Write(PathOf(session.session_id()), json, /*overwrite=*/true);
}

absl::optional<proto::StoredSession> FileSessionStore::Load(
    const std::string& id) {
  absl::MutexLock lock(&mutex_);
  return LoadLocked(id);
}

bool FileSessionStore::Exists(const std::string& id) {
  absl::MutexLock lock(&mutex_);
  return util::File::Exists(PathOf(id));
}

void FileSessionStore::Create(const std::string& id, const std::string& title) {
  absl::MutexLock lock(&mutex_);
  if (util::File::Exists(PathOf(id))) return;
  proto::StoredSession session;
  session.set_session_id(id);
  session.set_title(title);
  session.set_created_at(Now());
  StoreLocked(session);
  VLOG(1) << "Created session " << id;
}

void FileSessionStore::Append(const std::string& id,
                              const proto::StoredMessage& message) {
  absl::MutexLock lock(&mutex_);
  proto::StoredSession session = LoadExistingLocked(id);
  *session.add_messages() = message;
  StoreLocked(session);
}

void FileSessionStore::UpdateTotals(const std::string& id, int64_t tokens,
                                    double cost) {
  absl::MutexLock lock(&mutex_);
  proto::StoredSession session = LoadExistingLocked(id);
  session.set_total_tokens(session.total_tokens() + tokens);
  session.set_total_cost(session.total_cost() + cost);
  StoreLocked(session);
}

const constexpr size_t SessionRecorder::kMaxTitleLength;

SessionRecorder::SessionRecorder(SessionStore* store, std::string session_id,
                                 const std::string& task)
    : store_(store), session_id_(std::move(session_id)) {
  CHECK(store_ != nullptr);
  store_->Create(session_id_, Utf8Prefix(task, kMaxTitleLength));
  absl::optional<proto::StoredSession> session = store_->Load(session_id_);
  if (!session) {
    throw std::out_of_range(absl::StrCat("No such session: ", session_id_));
  }
  for (const proto::StoredMessage& message : session->messages()) {
    next_index_ = std::max(next_index_, message.order_index() + 1);
  }
  store_->Append(session_id_, UserQuery(task, next_index_++));
}

void SessionRecorder::Record(const proto::Event& event) {
  if (event.has_run_started()) return;
  store_->Append(session_id_, ToStoredMessage(event, next_index_++));
}

void SessionRecorder::Finish(const proto::CostLedger& ledger) {
  store_->UpdateTotals(session_id_, ledger.total_tokens(), ledger.total_cost());
}

}  // namespace manager
