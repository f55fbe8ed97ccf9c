//
// Appends big-endian values to a byte buffer
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>

#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_type.hh>

namespace pngchunk {
    class output {
        public:
            explicit output(std::vector<std::byte>& buffer) : m_buffer(buffer) {}

            void write(const void* src, std::size_t size) {
                if (size == 0) {
                    return;
                }
                auto bytes = static_cast<const std::byte*>(src);
                m_buffer.insert(m_buffer.end(), bytes, bytes + size);
            }

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                write(&value, sizeof(T));
            }

            void write_chunk_type(const chunk_type& type) {
                std::byte bytes[4];
                type.to_bytes(bytes);
                write(bytes, 4);
            }

            void reserve(std::size_t extra) {
                m_buffer.reserve(m_buffer.size() + extra);
            }

        private:
            std::vector<std::byte>& m_buffer;
    };
}
