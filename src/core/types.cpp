#include "core/types.hpp"

#include <type_traits>

namespace dropline {

static_assert(sizeof(Uuid) == Uuid::BYTE_SIZE, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

} // namespace dropline
