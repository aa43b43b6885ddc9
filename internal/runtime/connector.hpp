#pragma once

#include "internal/factory.hpp"

namespace negotiation::runtime {

/*
  Running connector: registers the service under its address on the loopback
  network and drives both manager loops.
*/
class Connector {
 public:
  explicit Connector(factory::Application app);
  ~Connector();

  Connector(const Connector&)            = delete;
  Connector& operator=(const Connector&) = delete;

  void Start();
  void Stop();

  const factory::Application& App() const {
    return app_;
  }

 private:
  factory::Application app_;
  bool                 started_ = false;
};

} // namespace negotiation::runtime
