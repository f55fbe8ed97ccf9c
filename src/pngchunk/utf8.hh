//
// UTF-8 validation
//

#pragma once

#include <cstddef>
#include <optional>

namespace pngchunk {
    // Returns the offset of the first byte that is not part of a well-formed
    // UTF-8 sequence, or nullopt if the whole buffer is valid
    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size);
}
