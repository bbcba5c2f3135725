#include "state_format.hpp"

#include <algorithm>
#include <cstring>
#include <format>

#include "file.hpp"
#include "math.hpp"

namespace pst::state
{
    std::array<std::uint8_t, STATE_HEADER_SIZE> encodeStateHeader(const StateHeader & header)
    {
        std::array<std::uint8_t, STATE_HEADER_SIZE> out{};
        std::copy(STATE_MAGIC.begin(), STATE_MAGIC.end(), out.begin());
        utils::writeUint16LE(out.data() + 4, header.version);
        utils::writeUint16LE(out.data() + 6, header.entry_size);
        utils::writeUint64LE(out.data() + 8, header.entry_count);
        utils::writeUint64LE(out.data() + 16, header.block_number);
        utils::writeUint64LE(out.data() + 24, header.chain_id);
        std::memcpy(out.data() + 32, header.block_hash.bytes, 32);
        return out;
    }

    std::expected<StateHeader, FormatError> decodeStateHeader(std::span<const std::uint8_t> bytes)
    {
        if(bytes.size() < STATE_HEADER_SIZE)
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::TRUNCATED,
                .message = std::format("header needs {} bytes, got {}", STATE_HEADER_SIZE, bytes.size())
            });
        }

        if(!std::equal(STATE_MAGIC.begin(), STATE_MAGIC.end(), bytes.begin()))
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::BAD_MAGIC,
                .message = std::format("expected magic 'PIR2', got {:02x}{:02x}{:02x}{:02x}",
                    bytes[0], bytes[1], bytes[2], bytes[3])
            });
        }

        StateHeader header;
        header.version = utils::readUint16LE(bytes.data() + 4);
        header.entry_size = utils::readUint16LE(bytes.data() + 6);
        header.entry_count = utils::readUint64LE(bytes.data() + 8);
        header.block_number = utils::readUint64LE(bytes.data() + 16);
        header.chain_id = utils::readUint64LE(bytes.data() + 24);
        std::memcpy(header.block_hash.bytes, bytes.data() + 32, 32);
        return header;
    }

    std::size_t encodeStorageEntry(const StorageEntry & entry, std::vector<std::uint8_t> & out)
    {
        const std::size_t start = out.size();
        out.insert(out.end(), std::begin(entry.address.bytes), std::end(entry.address.bytes));
        out.insert(out.end(), std::begin(entry.tree_index.bytes), std::end(entry.tree_index.bytes));
        out.insert(out.end(), std::begin(entry.value.bytes), std::end(entry.value.bytes));
        return out.size() - start;
    }

    StorageEntry decodeStorageEntry(const std::uint8_t* data)
    {
        StorageEntry entry;
        std::memcpy(entry.address.bytes, data, 20);
        std::memcpy(entry.tree_index.bytes, data + 20, 32);
        std::memcpy(entry.value.bytes, data + 52, 32);
        return entry;
    }

    ubt::TreeKey entryTreeKey(const StorageEntry & entry)
    {
        return ubt::computeTreeKey(entry.address, entry.tree_index);
    }

    std::expected<StateFile, FormatError> StateFile::decode(std::span<const std::uint8_t> bytes)
    {
        auto header_res = decodeStateHeader(bytes);
        if(!header_res)
        {
            return std::unexpected(header_res.error());
        }

        const StateHeader & header = *header_res;
        if(header.version != STATE_VERSION)
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::UNSUPPORTED_VERSION,
                .message = std::format("version {} is not supported (expected {})", header.version, STATE_VERSION)
            });
        }

        if(header.entry_size != STATE_ENTRY_SIZE)
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::UNSUPPORTED_ENTRY_SIZE,
                .message = std::format("entry size {} is not supported (expected {})", header.entry_size, STATE_ENTRY_SIZE)
            });
        }

        const std::size_t payload = bytes.size() - STATE_HEADER_SIZE;
        if(header.entry_count > payload / STATE_ENTRY_SIZE || payload != header.entry_count * STATE_ENTRY_SIZE)
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::SIZE_MISMATCH,
                .message = std::format("{} entries declared, file has {} payload bytes", header.entry_count, payload)
            });
        }

        StateFile state;
        state.header = header;
        state.entries.reserve(header.entry_count);
        for(std::size_t i = 0; i < header.entry_count; ++i)
        {
            state.entries.push_back(decodeStorageEntry(bytes.data() + STATE_HEADER_SIZE + i * STATE_ENTRY_SIZE));
        }
        return state;
    }

    std::expected<StateFile, FormatError> StateFile::load(const std::filesystem::path & path)
    {
        const auto bytes = file::loadBinaryFile(path);
        if(!bytes)
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::IO_ERROR,
                .message = std::format("cannot read {}", path.string())
            });
        }
        return decode(*bytes);
    }
}
