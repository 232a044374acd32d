#pragma once

#include <memory>
#include <string>

#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"

namespace CloudTrace {

// All references to google::protobuf in cloudtrace go through this alias so the protobuf
// namespace can be swapped in one place.
namespace Protobuf = google::protobuf; // NOLINT(misc-unused-alias-decls)

namespace ProtobufTypes {

using MessagePtr = std::unique_ptr<Protobuf::Message>;

} // namespace ProtobufTypes
} // namespace CloudTrace
