#pragma once

#include <string>

namespace ragkit_core {

// Identifies one request. Passed by value/reference through every pipeline stage.
struct RequestContext {
  std::string request_id;
  std::string trace_id;
  std::string tenant_id;

  // Generates fresh ids; an empty request_id argument means "generate one".
  static RequestContext create(const std::string &tenant_id, const std::string &request_id = "");
};

}  // namespace ragkit_core
