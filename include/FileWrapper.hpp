#pragma once
#include <string>

namespace tekton {
    // File access used by the build script loader.
    class FileWrapper {
    public:
        virtual ~FileWrapper() = default;

        [[nodiscard]] virtual bool exists(const std::string &path) const = 0;

        // Whole content of the file; throws std::runtime_error when unreadable.
        [[nodiscard]] virtual std::string read_all_text(const std::string &path) const = 0;
    };

    class LocalFileWrapper : public FileWrapper {
    public:
        [[nodiscard]] bool exists(const std::string &path) const override;

        [[nodiscard]] std::string read_all_text(const std::string &path) const override;
    };
} // namespace tekton
