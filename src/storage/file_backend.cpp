#include "geni/storage/file_backend.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "geni/common/log.hpp"

namespace geni::storage
{
    namespace fs = std::filesystem;

    FileBackend::FileBackend(fs::path path)
        : path_(std::move(path))
    {
    }

    std::optional<std::string> FileBackend::get()
    {
        std::error_code ec;
        if (!fs::exists(path_, ec))
        {
            if (ec)
                throw std::runtime_error("Cannot access " + path_.string() + ": " + ec.message());
            return std::nullopt;
        }

        std::ifstream in(path_, std::ios::in | std::ios::binary);
        if (!in)
            throw std::runtime_error("Failed to open " + path_.string() + " for reading");

        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
            throw std::runtime_error("Failed to read " + path_.string());

        return content;
    }

    void FileBackend::set(const std::string& secret)
    {
        const auto dir = path_.parent_path();
        if (!dir.empty() && !fs::exists(dir))
        {
            fs::create_directories(dir);
            fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
        }

        auto tmp = path_;
        tmp += ".tmp";

        {
            std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!out)
                throw std::runtime_error("Failed to open " + tmp.string() + " for writing");

            // owner read/write only, before any secret byte lands on disk
            fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

            out << secret;
            out.flush();
            if (!out)
            {
                std::error_code ignored;
                fs::remove(tmp, ignored);
                throw std::runtime_error("Failed while writing " + tmp.string());
            }
        }

        std::error_code ec;
        fs::rename(tmp, path_, ec);
        if (ec)
        {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw std::runtime_error("Failed to replace " + path_.string() + ": " + ec.message());
        }

        GENI_LOG_DEBUG("Wrote " << path_.string());
    }

    void FileBackend::remove()
    {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec)
            throw std::runtime_error("Failed to remove " + path_.string() + ": " + ec.message());
    }
} // namespace geni::storage
