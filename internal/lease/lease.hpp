#pragma once

#include <chrono>
#include <string>

namespace docflow::lease {

/*
  Time-bounded ownership of one execution by one worker.
*/
struct Lease {
  std::string lease_id;
  std::string execution_id;

  std::chrono::system_clock::time_point expires_at;
};

}
