#pragma once

#include <string>

namespace request_id {

// 16 lowercase hex characters, unique per call for practical purposes.
std::string generate();

} // namespace request_id
