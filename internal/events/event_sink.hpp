#pragma once

#include "capacity/manager/v1.hpp"

namespace capacity::events {

/*
  EventSink

  Receives notifications after the state change they describe has been
  committed. Publishing never fails the originating operation.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const capacity::manager::v1::Event& event) = 0;
};

} // namespace capacity::events
