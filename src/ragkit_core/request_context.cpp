#include "ragkit_core/request_context.hpp"

#include "ragkit_core/util/id_generator.hpp"

namespace ragkit_core {

RequestContext RequestContext::create(const std::string &tenant_id, const std::string &request_id) {
  RequestContext context;
  context.tenant_id = tenant_id;
  context.request_id = request_id.empty() ? IdGenerator::generate_uuid() : request_id;
  context.trace_id = IdGenerator::generate_hex(16);
  return context;
}

}  // namespace ragkit_core
