#include "connector.hpp"

#include "internal/observability/logging.hpp"

namespace negotiation::runtime {

Connector::Connector(factory::Application app) : app_(std::move(app)) {
}

Connector::~Connector() {
  Stop();
}

void Connector::Start() {
  if (started_) {
    return;
  }
  app_.network->Register(app_.address, app_.service.get());
  app_.consumer_manager->Start();
  app_.provider_manager->Start();
  started_ = true;

  NEGOTIATION_LOG_INFO("connector started",
                       {observability::StringField("participant_id", app_.participant_id), observability::StringField("address", app_.address)});
}

void Connector::Stop() {
  if (!started_) {
    return;
  }
  // stop sending before the address disappears
  app_.consumer_manager->Stop();
  app_.provider_manager->Stop();
  app_.network->Unregister(app_.address);
  started_ = false;

  NEGOTIATION_LOG_INFO("connector stopped", {observability::StringField("participant_id", app_.participant_id)});
}

} // namespace negotiation::runtime
