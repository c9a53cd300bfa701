#include "request_id.hpp"

#include <format>
#include <random>

namespace request_id {

std::string generate() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return std::format("{:016x}", rng());
}

} // namespace request_id
