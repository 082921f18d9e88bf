#ifndef SRC_LOOM_HASH_HPP_
#define SRC_LOOM_HASH_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace loom {

using Hash = std::uint64_t;

Hash hash(std::string_view text, Hash seed = 0);
Hash hash(const char* text, size_t length, Hash seed = 0);

// Lower-case hexadecimal rendering of |h|, always 16 characters long.
std::string hashToString(Hash h);

} // namespace loom

#endif // SRC_LOOM_HASH_HPP_
