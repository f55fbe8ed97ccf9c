#include <cstdint>

#include "utf8.hh"

namespace pngchunk {
    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            const auto lead = static_cast<std::uint8_t>(data[i]);

            if (lead < 0x80) {
                ++i;
                continue;
            }

            std::size_t extra;
            std::uint32_t cp;
            std::uint32_t min_cp;
            if ((lead & 0xE0) == 0xC0) {
                extra = 1;
                cp = lead & 0x1F;
                min_cp = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                extra = 2;
                cp = lead & 0x0F;
                min_cp = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                extra = 3;
                cp = lead & 0x07;
                min_cp = 0x10000;
            } else {
                // Stray continuation byte or 0xF8..0xFF
                return i;
            }

            if (size - i <= extra) {
                return i;
            }

            for (std::size_t k = 1; k <= extra; ++k) {
                const auto cont = static_cast<std::uint8_t>(data[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    return i;
                }
                cp = (cp << 6) | (cont & 0x3F);
            }

            // Overlong forms, UTF-16 surrogates and values past U+10FFFF
            if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                return i;
            }

            i += extra + 1;
        }
        return std::nullopt;
    }
}
