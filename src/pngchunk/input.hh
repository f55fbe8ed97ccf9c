//
// Cursor over an in-memory byte slice
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {
    // Reads from a region of memory it does not own - throws on error
    class input {
        public:
            enum whence_t {
                set,
                cur
            };

        public:
            input(const void* data, std::size_t size);

            // Copies up to size bytes, returns the number actually copied
            std::size_t read(void* dst, std::size_t size);
            void seek(std::uint64_t offset, whence_t whence);
            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::uint64_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

            // Pointer to the byte at the current position
            [[nodiscard]] const std::byte* current() const { return m_data + m_position; }

            // Create an input over the next size bytes without advancing
            [[nodiscard]] input create_subinput(std::size_t size) const;

            // Convenience methods
            std::vector<std::byte> read_exact(std::size_t size) {
                PNGCHUNK_THROW_PARSE_IF(size > remaining(), error_code::truncated,
                    "Unexpected end of data at offset ", m_position, ": requested ", size,
                    " bytes, only ", remaining(), " available");
                std::vector<std::byte> buffer(size);
                read(buffer.data(), size);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                PNGCHUNK_THROW_PARSE_IF(actual != sizeof(T), error_code::truncated,
                    "Failed to read ", sizeof(T), " bytes at offset ", m_position - actual);

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            chunk_type read_chunk_type();

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
