#pragma once

#include <memory>

namespace docflow::orchestrator { class Orchestrator; }

namespace docflow::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<docflow::orchestrator::Orchestrator> orchestrator;
};

}
