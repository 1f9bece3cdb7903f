#ifndef MANAGER_RECORDS_HPP
#define MANAGER_RECORDS_HPP

#include <string>

#include "proto/event.pb.h"
#include "proto/session.pb.h"

namespace manager {

// Stored form of an event: the kind tag, and the payload as JSON with the
// field names of the proto files. Throws std::invalid_argument for an event
// with no payload.
proto::StoredMessage ToStoredMessage(const proto::Event& event,
                                     int64_t order_index);

// The record opening every run: {"query": task}.
proto::StoredMessage UserQuery(const std::string& task, int64_t order_index);

// Current time, RFC 3339.
std::string Now();

}  // namespace manager

#endif
