#pragma once

#include "sink_record.hpp"

namespace profile::sink {

/*
  Destination for saved documents outside the store (analytics, backups).
  Forward() throws on delivery failure; callers treat it as best effort.
*/
class SaveSink {
 public:
  virtual ~SaveSink() = default;

  virtual void Forward(const SinkRecord& record) = 0;
};

} // namespace profile::sink
