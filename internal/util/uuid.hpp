#pragma once

#include <string>

namespace analysis::util {

/*
  Random RFC 4122 version 4 identifier, lower-case hex in 8-4-4-4-12 form.

  Used for producer-less task ids and for delivery lease ids; each thread
  draws from its own generator.
*/
std::string GenerateUUIDString();

} // namespace analysis::util
