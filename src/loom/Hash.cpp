#include "loom/Hash.hpp"

#include "fmt/format.h"
#include "xxhash.h"

namespace loom {

Hash hash(std::string_view text, Hash seed) {
    return hash(text.data(), text.size(), seed);
}

Hash hash(const char* text, size_t length, Hash seed) {
    return XXH64(text, length, seed);
}

std::string hashToString(Hash h) {
    return fmt::format("{:016x}", h);
}

} // namespace loom
