#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <ostream>
#include <sstream>
#include <utility>

#include "input.hh"
#include "output.hh"

namespace pngchunk {

    namespace {
        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        std::vector<std::uint8_t> leading_bytes(const void* data, std::size_t size) {
            auto first = static_cast<const std::uint8_t*>(data);
            return {first, first + std::min(size, container::signature.size())};
        }
    }

    container::container()
        : m_header(signature) {
    }

    container container::parse(const void* data, std::size_t size, const parse_options& options) {
        if (size < signature.size()) {
            throw header_error(error_code::missing_header, leading_bytes(data, size), build_error_msg(
                "Missing PNG header: need ", signature.size(), " bytes, got ", size));
        }

        input in(data, size);
        container result;

        std::array<std::uint8_t, 8> header;
        in.read(header.data(), header.size());
        if (header != signature) {
            std::ostringstream found;
            for (std::size_t i = 0; i < header.size(); i++) {
                found << (i ? ", " : "") << static_cast<unsigned>(header[i]);
            }
            throw header_error(error_code::bad_header, leading_bytes(data, size), build_error_msg(
                "Invalid PNG header: [", found.str(), "]"));
        }

        while (!in.at_end()) {
            std::uint64_t start_pos = in.tell();

            // A length field needs 4 bytes, fewer is stray data after the last chunk
            if (in.remaining() < 4) {
                if (options.reject_trailing_data) {
                    PNGCHUNK_THROW_PARSE(error_code::truncated,
                        in.remaining(), " trailing bytes at offset ", start_pos,
                        " are too few for a chunk length");
                }
                warn(options, start_pos, "trailing_data", build_error_msg(
                    "Ignoring ", in.remaining(), " trailing bytes after the last chunk"));
                break;
            }

            auto length = in.read<std::uint32_t>(byte_order::big);
            in.seek(start_pos, input::set);

            // length + type + data + crc
            std::uint64_t chunk_size = std::uint64_t(length) + chunk::framing_size;
            PNGCHUNK_THROW_PARSE_IF(chunk_size > in.remaining(), error_code::truncated,
                "Chunk at offset ", start_pos, " needs ", chunk_size, " bytes but only ",
                in.remaining(), " remain");

            if (length > options.max_chunk_size) {
                if (options.strict) {
                    PNGCHUNK_THROW_PARSE(error_code::chunk_too_large,
                        "Chunk at offset ", start_pos, " has size ", length,
                        " bytes, which exceeds maximum allowed size of ",
                        options.max_chunk_size, " bytes");
                }
                warn(options, start_pos, "size_limit", build_error_msg(
                    "Chunk size ", length, " exceeds maximum ", options.max_chunk_size));
            }

            auto region = in.create_subinput(static_cast<std::size_t>(chunk_size));
            result.m_chunks.push_back(chunk::parse(region.current(), static_cast<std::size_t>(region.size())));
            in.seek(chunk_size, input::cur);
        }

        if (result.m_chunks.empty()) {
            warn(options, in.tell(), "empty_stream", "PNG stream contains no chunks");
        } else if (result.m_chunks.back().type() != chunk_types::IEND) {
            warn(options, in.tell(), "missing_iend", build_error_msg(
                "Last chunk is ", result.m_chunks.back().type(), " instead of 'IEND'"));
        }

        return result;
    }

    std::vector<std::byte> container::to_wire_bytes() const {
        std::size_t total = m_header.size();
        for (const auto& c : m_chunks) {
            total += c.wire_size();
        }

        std::vector<std::byte> result;
        result.reserve(total);

        output out(result);
        out.write(m_header.data(), m_header.size());
        for (const auto& c : m_chunks) {
            c.append_wire_bytes(result);
        }
        return result;
    }

    void container::insert(chunk c) {
        if (m_chunks.empty()) {
            m_chunks.push_back(std::move(c));
            return;
        }
        m_chunks.insert(m_chunks.end() - 1, std::move(c));
    }

    void container::append(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk container::remove_first_by_type(std::string_view type_text) {
        auto type = chunk_type::parse(type_text);

        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& c) {
            return c.type() == type;
        });
        if (it == m_chunks.end()) {
            throw not_found_error(build_error_msg("Chunk not found: no chunk of type ", type));
        }

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* container::find_first_by_type(std::string_view type_text) const {
        // A malformed query is not an error here, it simply matches nothing
        auto type = chunk_type::try_parse(type_text);
        if (!type) {
            return nullptr;
        }

        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& c) {
            return c.type() == *type;
        });
        return it == m_chunks.end() ? nullptr : &*it;
    }

    std::ostream& operator<<(std::ostream& os, const container& c) {
        os << "Header: [";
        for (std::size_t i = 0; i < c.m_header.size(); i++) {
            os << (i ? ", " : "") << static_cast<unsigned>(c.m_header[i]);
        }
        os << "]\n";
        for (const auto& ch : c.m_chunks) {
            os << ch << "\n";
        }
        return os;
    }

} // namespace pngchunk
