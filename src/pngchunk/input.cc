#include <algorithm>

#include "input.hh"

namespace pngchunk {
    input::input(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        PNGCHUNK_THROW_PARSE_IF(!data && size > 0, error_code::too_short, "Null buffer of size ", size);
    }

    std::size_t input::read(void* dst, std::size_t size) {
        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }

        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void input::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos;

        switch (whence) {
            case set:
                new_pos = offset;
                break;
            case cur:
                new_pos = m_position + offset;
                break;
            default:
                PNGCHUNK_THROW_PARSE(error_code::truncated, "Invalid whence value: ", static_cast<int>(whence));
        }

        PNGCHUNK_THROW_PARSE_IF(new_pos > m_size, error_code::truncated,
            "Cannot seek to offset ", new_pos, " - buffer size is only ", m_size, " bytes");

        m_position = static_cast<std::size_t>(new_pos);
    }

    input input::create_subinput(std::size_t size) const {
        PNGCHUNK_THROW_PARSE_IF(size > remaining(), error_code::truncated,
            "Region of ", size, " bytes at offset ", m_position, " exceeds the ",
            remaining(), " bytes left");
        return input(current(), size);
    }

    chunk_type input::read_chunk_type() {
        std::array<std::uint8_t, 4> data;
        std::size_t actual = read(data.data(), 4);
        PNGCHUNK_THROW_PARSE_IF(actual != 4, error_code::truncated, "Failed to read chunk type");
        return chunk_type(data);
    }
}
