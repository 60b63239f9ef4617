// A temporary file placed next to a target so that it can replace the target
// with a single rename. Unless committed, the file is removed on destruction.

#ifndef EXCISE_TEMPFILE_HPP
#define EXCISE_TEMPFILE_HPP

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

#include "Util.hpp"
#include "Errors.hpp"

namespace Excise
{

class TempFile
{
public:
    explicit TempFile(const std::filesystem::path & target)
        : target(target),
        path(siblingPath(target)),
        pathPtr(&path, &deleteFile)
    {
    }

    TempFile(const TempFile &) = delete;
    TempFile & operator=(const TempFile &) = delete;
    TempFile(TempFile &&) = delete;
    TempFile & operator=(TempFile &&) = delete;

    ~TempFile() = default;

    const std::filesystem::path & getPath() const noexcept
    {
        return path;
    }

    void write(std::string_view content)
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            throw IOError(path, "could not create temporary file");
        }
        file << content;
        file.close();
        if (file.fail())
        {
            throw IOError(path, "write to temporary file failed");
        }
        copyPermissions();
    }

    // Atomically replaces the target with the written content.
    void commit()
    {
        std::error_code ec;
        std::filesystem::rename(path, target, ec);
        if (ec)
        {
            throw IOError(target, "could not replace file: " + ec.message());
        }
        pathPtr.release();
        SPDLOG_TRACE("Committed {} over {}", path.string(), target.string());
    }

    static void deleteFile(const std::filesystem::path * path)
    {
        std::error_code ec;
        std::filesystem::remove(*path, ec);
    }

private:
    std::filesystem::path target;
    std::filesystem::path path;
    std::unique_ptr<std::filesystem::path, decltype(&deleteFile)> pathPtr;

    static std::filesystem::path siblingPath(const std::filesystem::path & target)
    {
        std::filesystem::path dir = target.parent_path();
        if (dir.empty()) dir = ".";
        return dir / ("." + target.filename().string() + "." + generateUniqueName() + ".tmp");
    }

    static std::string generateUniqueName()
    {
        auto timestamp = std::chrono::system_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 9999);
        return "excise_" + std::to_string(timestamp) + "_" + std::to_string(dis(gen));
    }

    void copyPermissions()
    {
        std::error_code ec;
        std::filesystem::file_status status = std::filesystem::status(target, ec);
        if (ec || !std::filesystem::exists(status)) return;
        std::filesystem::permissions(path, status.permissions(), std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            SPDLOG_WARN("Could not copy permissions of {}: {}", target.string(), ec.message());
        }
    }
};

} // namespace Excise

#endif // EXCISE_TEMPFILE_HPP
