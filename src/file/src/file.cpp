#include "file.hpp"

#include <cctype>
#include <format>

#include "native.h"

namespace pst::file
{
    namespace
    {
        void _removeQuietly(const std::filesystem::path & path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if(ec)
            {
                spdlog::warn("Cannot remove {}: {}", path.string(), ec.message());
            }
        }

        void _restoreBackup(const std::filesystem::path & backup, const std::filesystem::path & path)
        {
            std::error_code ec;
            std::filesystem::rename(backup, path, ec);
            if(ec)
            {
                spdlog::error("Cannot restore {} from {}: {}", path.string(), backup.string(), ec.message());
            }
        }

        std::expected<void, std::string> _writeTemporary(const std::filesystem::path & tmp_path, std::span<const std::uint8_t> content)
        {
            {
                std::ofstream output(tmp_path, std::ios::out | std::ios::binary | std::ios::trunc);
                if(!output.is_open())
                {
                    return std::unexpected(std::format("Failed to open {}", tmp_path.string()));
                }

                output.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
                output.flush();
                if(!output.good())
                {
                    output.close();
                    _removeQuietly(tmp_path);
                    return std::unexpected(std::format("Failed to write {}", tmp_path.string()));
                }
            }

            if(!native::syncPath(tmp_path))
            {
                _removeQuietly(tmp_path);
                return std::unexpected(std::format("Failed to sync {}", tmp_path.string()));
            }
            return {};
        }
    }

    std::optional<std::string> loadTextFile(std::filesystem::path path)
    {
        if(std::filesystem::exists(path) == false)
        {
            spdlog::error("Cannot find file {}", path.string());
            return std::nullopt;
        }

        std::ifstream file(path, std::ios::in);

        if(file.good() == false)
        {
            spdlog::error("Failed to open file {}", path.string());
            return std::nullopt;
        }

        const std::string file_content = std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

        file.close();

        return file_content;
    }

    std::optional<std::vector<std::uint8_t>> loadBinaryFile(std::filesystem::path path)
    {
        if (!std::filesystem::exists(path)) {
            spdlog::error("Cannot find {} file.", path.string());
            return std::nullopt;
        }

        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            spdlog::error("Failed to open file {}", path.string());
            return std::nullopt;
        }

        const std::streamsize size = file.tellg();
        if (size < 0) {
            spdlog::error("File {} is unreadable.", path.string());
            return std::nullopt;
        }

        std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
        file.seekg(0);
        if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
            spdlog::error("Failed to read file {}", path.string());
            return std::nullopt;
        }

        return buffer;
    }

    std::optional<std::vector<std::string>> loadListFile(std::filesystem::path path)
    {
        const auto content = loadTextFile(path);
        if(!content)
        {
            return std::nullopt;
        }

        std::vector<std::string> lines;
        std::size_t start = 0;
        while(start <= content->size())
        {
            std::size_t end = content->find('\n', start);
            if(end == std::string::npos)
            {
                end = content->size();
            }

            std::size_t first = start;
            std::size_t last = end;
            while(first < last && std::isspace(static_cast<unsigned char>((*content)[first])))
            {
                ++first;
            }
            while(last > first && std::isspace(static_cast<unsigned char>((*content)[last - 1])))
            {
                --last;
            }

            if(last > first && (*content)[first] != '#')
            {
                lines.emplace_back(content->substr(first, last - first));
            }

            start = end + 1;
        }

        return lines;
    }

    std::filesystem::path temporaryPath(const std::filesystem::path & path)
    {
        std::filesystem::path tmp = path;
        tmp += std::format(".{}.tmp", native::processId());
        return tmp;
    }

    std::filesystem::path backupPath(const std::filesystem::path & path)
    {
        std::filesystem::path backup = path;
        backup += std::format(".{}.bak", native::processId());
        return backup;
    }

    std::expected<void, std::string> writeFileAtomic(const std::filesystem::path & path, std::span<const std::uint8_t> content)
    {
        const PendingFile pending{.path = path, .content = content};
        return writeFilesAtomic(std::span<const PendingFile>(&pending, 1));
    }

    std::expected<void, std::string> writeFileAtomic(const std::filesystem::path & path, const std::string & content)
    {
        return writeFileAtomic(path, std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(content.data()), content.size()));
    }

    std::expected<void, std::string> writeFilesAtomic(std::span<const PendingFile> files)
    {
        for(const PendingFile & pending : files)
        {
            std::error_code ec;
            const auto status = std::filesystem::symlink_status(pending.path, ec);
            if(std::filesystem::exists(status) && !std::filesystem::is_regular_file(status))
            {
                return std::unexpected(std::format("{} exists and is not a regular file", pending.path.string()));
            }
        }

        // stage
        std::vector<std::filesystem::path> staged;
        staged.reserve(files.size());
        for(const PendingFile & pending : files)
        {
            const std::filesystem::path tmp_path = temporaryPath(pending.path);
            if(auto res = _writeTemporary(tmp_path, pending.content); !res)
            {
                for(const std::filesystem::path & path : staged)
                {
                    _removeQuietly(path);
                }
                return std::unexpected(res.error());
            }
            staged.push_back(tmp_path);
        }

        // commit
        struct Committed
        {
            std::filesystem::path path;
            std::optional<std::filesystem::path> backup;
        };
        std::vector<Committed> committed;
        committed.reserve(files.size());

        const auto rollback = [&]()
        {
            for(auto it = committed.rbegin(); it != committed.rend(); ++it)
            {
                _removeQuietly(it->path);
                if(it->backup)
                {
                    _restoreBackup(*it->backup, it->path);
                }
            }
            for(std::size_t i = committed.size(); i < staged.size(); ++i)
            {
                _removeQuietly(staged[i]);
            }
        };

        for(std::size_t i = 0; i < files.size(); ++i)
        {
            const std::filesystem::path & path = files[i].path;
            std::optional<std::filesystem::path> backup;

            std::error_code ec;
            if(std::filesystem::exists(path, ec))
            {
                backup = backupPath(path);
                std::filesystem::rename(path, *backup, ec);
                if(ec)
                {
                    rollback();
                    return std::unexpected(std::format("Failed to back up {}: {}", path.string(), ec.message()));
                }
            }

            std::filesystem::rename(staged[i], path, ec);
            if(ec)
            {
                const std::string message = std::format("Failed to rename {} to {}: {}", staged[i].string(), path.string(), ec.message());
                if(backup)
                {
                    _restoreBackup(*backup, path);
                }
                rollback();
                return std::unexpected(message);
            }

            committed.push_back(Committed{.path = path, .backup = std::move(backup)});
        }

        for(const Committed & item : committed)
        {
            if(item.backup)
            {
                _removeQuietly(*item.backup);
            }
            spdlog::debug("Wrote {}", item.path.string());
        }

        for(const Committed & item : committed)
        {
            const std::filesystem::path dir = item.path.has_parent_path() ? item.path.parent_path() : std::filesystem::path(".");
            if(!native::syncPath(dir))
            {
                spdlog::warn("Cannot sync directory {}", dir.string());
            }
        }

        return {};
    }
}
