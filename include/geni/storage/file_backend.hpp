#pragma once

#include <filesystem>

#include "geni/storage/secret_backend.hpp"

namespace geni::storage
{
    /**
     * Plain file readable only by its owner (0600) in a 0700 directory
     * Writes go through a temporary file and rename, so readers see either
     * the old or the new content
     */
    class FileBackend : public SecretBackend
    {
    public:
        explicit FileBackend(std::filesystem::path path);

        std::optional<std::string> get() override;
        void set(const std::string& secret) override;
        void remove() override;

        [[nodiscard]] std::string name() const override { return "file"; }

        [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    private:
        std::filesystem::path path_;
    };
} // namespace geni::storage
