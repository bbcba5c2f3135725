#include "stem_index.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

#include "file.hpp"
#include "math.hpp"

namespace pst::state
{
    namespace
    {
        std::string _stemHex(const ubt::Stem & stem)
        {
            return evmc::hex(evmc::bytes_view(stem.data(), stem.size()));
        }
    }

    StemIndex::StemIndex(std::vector<StemIndexEntry> entries)
        : _entries(std::move(entries))
    {
    }

    std::expected<StemIndex, FormatError> StemIndex::fromSortedStems(std::span<const ubt::Stem> sorted_stems)
    {
        std::vector<StemIndexEntry> entries;
        for(std::size_t i = 0; i < sorted_stems.size(); ++i)
        {
            if(!entries.empty())
            {
                const ubt::Stem & last = entries.back().stem;
                if(sorted_stems[i] == last)
                {
                    continue;
                }
                if(sorted_stems[i] < last)
                {
                    return std::unexpected(FormatError{
                        .kind = FormatError::Kind::UNSORTED,
                        .message = std::format("stem at position {} is smaller than its predecessor", i)
                    });
                }
            }

            entries.push_back(StemIndexEntry{
                .stem = sorted_stems[i],
                .offset = static_cast<std::uint64_t>(i)
            });
        }
        return StemIndex(std::move(entries));
    }

    std::expected<StemIndex, FormatError> StemIndex::rebuild(const StateFile & state, const bool verify)
    {
        std::vector<ubt::Stem> stems;
        stems.reserve(state.entries.size());

        std::optional<std::uint8_t> prev_subindex;
        for(std::size_t i = 0; i < state.entries.size(); ++i)
        {
            const StorageEntry & entry = state.entries[i];
            ubt::Stem stem = ubt::computeStem(entry.address, entry.tree_index);
            const std::uint8_t subindex = ubt::getSubindex(entry.tree_index);

            if(!stems.empty() && stems.back() == stem && prev_subindex && *prev_subindex > subindex)
            {
                return std::unexpected(FormatError{
                    .kind = FormatError::Kind::UNSORTED,
                    .message = std::format("entry {} breaks tree key order", i)
                });
            }

            stems.push_back(stem);
            prev_subindex = subindex;

            if((i + 1) % 1'000'000 == 0)
            {
                spdlog::info("Stem index: processed {} / {} entries", i + 1, state.entries.size());
            }
        }

        auto index_res = fromSortedStems(stems);
        if(!index_res)
        {
            return std::unexpected(index_res.error());
        }

        spdlog::info("Stem index: {} unique stems for {} entries", index_res->size(), state.entries.size());

        if(verify)
        {
            const auto decoded_res = decode(index_res->encode());
            if(!decoded_res)
            {
                return std::unexpected(decoded_res.error());
            }

            if(decoded_res->size() != index_res->size())
            {
                return std::unexpected(FormatError{
                    .kind = FormatError::Kind::INDEX_MISMATCH,
                    .message = std::format("decoded {} stems, encoded {}", decoded_res->size(), index_res->size())
                });
            }

            if(auto verify_res = verifyStemIndex(state, *decoded_res); !verify_res)
            {
                return std::unexpected(verify_res.error());
            }
            spdlog::info("Stem index verification passed");
        }

        return index_res;
    }

    std::expected<StemIndex, FormatError> StemIndex::decode(std::span<const std::uint8_t> bytes)
    {
        if(bytes.size() < STEM_INDEX_COUNT_SIZE)
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::TRUNCATED,
                .message = std::format("stem index needs at least {} bytes, got {}", STEM_INDEX_COUNT_SIZE, bytes.size())
            });
        }

        const std::uint64_t count = utils::readUint64LE(bytes.data());
        if(count > std::numeric_limits<std::size_t>::max() / STEM_INDEX_ENTRY_SIZE)
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::COUNT_OVERFLOW,
                .message = std::format("stem count {} overflows", count)
            });
        }

        const std::size_t needed = STEM_INDEX_COUNT_SIZE + static_cast<std::size_t>(count) * STEM_INDEX_ENTRY_SIZE;
        if(bytes.size() < needed)
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::TRUNCATED,
                .message = std::format("stem index declares {} stems ({} bytes), got {} bytes", count, needed, bytes.size())
            });
        }

        std::vector<StemIndexEntry> entries;
        entries.reserve(static_cast<std::size_t>(count));

        const std::uint8_t* cursor = bytes.data() + STEM_INDEX_COUNT_SIZE;
        for(std::uint64_t i = 0; i < count; ++i)
        {
            StemIndexEntry entry;
            std::copy_n(cursor, ubt::STEM_SIZE, entry.stem.begin());
            entry.offset = utils::readUint64LE(cursor + ubt::STEM_SIZE);
            cursor += STEM_INDEX_ENTRY_SIZE;

            if(!entries.empty() && !(entries.back().stem < entry.stem))
            {
                return std::unexpected(FormatError{
                    .kind = FormatError::Kind::UNSORTED,
                    .message = std::format("stem {} at position {} is not strictly ascending", _stemHex(entry.stem), i)
                });
            }
            entries.push_back(entry);
        }

        return StemIndex(std::move(entries));
    }

    std::expected<StemIndex, FormatError> StemIndex::load(const std::filesystem::path & path)
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

    std::vector<std::uint8_t> StemIndex::encode() const
    {
        std::vector<std::uint8_t> out(STEM_INDEX_COUNT_SIZE + _entries.size() * STEM_INDEX_ENTRY_SIZE, 0);
        utils::writeUint64LE(out.data(), static_cast<std::uint64_t>(_entries.size()));

        std::uint8_t* cursor = out.data() + STEM_INDEX_COUNT_SIZE;
        for(const StemIndexEntry & entry : _entries)
        {
            std::copy(entry.stem.begin(), entry.stem.end(), cursor);
            utils::writeUint64LE(cursor + ubt::STEM_SIZE, entry.offset);
            cursor += STEM_INDEX_ENTRY_SIZE;
        }
        return out;
    }

    std::optional<std::uint64_t> StemIndex::findOffset(const ubt::Stem & stem) const
    {
        const auto it = std::ranges::lower_bound(_entries, stem, {}, &StemIndexEntry::stem);
        if(it == _entries.end() || it->stem != stem)
        {
            return std::nullopt;
        }
        return it->offset;
    }

    const std::vector<StemIndexEntry> & StemIndex::entries() const noexcept
    {
        return _entries;
    }

    std::size_t StemIndex::size() const noexcept
    {
        return _entries.size();
    }

    std::expected<void, FormatError> verifyStemIndex(const StateFile & state, const StemIndex & index)
    {
        std::size_t distinct = 0;
        std::optional<ubt::Stem> prev;

        for(std::size_t i = 0; i < state.entries.size(); ++i)
        {
            const ubt::Stem stem = ubt::computeStem(state.entries[i].address, state.entries[i].tree_index);
            if(prev && *prev == stem)
            {
                continue;
            }
            prev = stem;
            ++distinct;

            const auto offset = index.findOffset(stem);
            if(!offset)
            {
                return std::unexpected(FormatError{
                    .kind = FormatError::Kind::INDEX_MISMATCH,
                    .message = std::format("stem {} of entry {} is missing from the index", _stemHex(stem), i)
                });
            }

            if(*offset != i)
            {
                return std::unexpected(FormatError{
                    .kind = FormatError::Kind::INDEX_MISMATCH,
                    .message = std::format("stem {} maps to {}, first entry is {}", _stemHex(stem), *offset, i)
                });
            }
        }

        if(distinct != index.size())
        {
            return std::unexpected(FormatError{
                .kind = FormatError::Kind::INDEX_MISMATCH,
                .message = std::format("index has {} stems, state file has {}", index.size(), distinct)
            });
        }

        return {};
    }
}
