#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace codeauditor {

/**
 * @brief Uniquely named, owner-only directory for one sandbox run
 *
 * Created as <root>/run-<run_id>-XXXXXX (mkdtemp, mode 0700). The whole tree
 * is removed by the destructor on every exit path. Removal failures are
 * logged, never thrown.
 *
 * Move-only.
 */
class ScratchDirectory {
public:
    /**
     * @brief Create the directory (and `root` if it does not exist yet)
     * @throws std::runtime_error if the directory cannot be created
     */
    ScratchDirectory(const std::filesystem::path& root, std::string_view run_id);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;
    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    /**
     * @brief Write `content` to <dir>/<file_name> with mode 0600
     * @return Absolute path of the written file
     * @throws std::runtime_error on any I/O failure
     */
    std::filesystem::path write_file(std::string_view file_name, std::string_view content) const;

private:
    void remove() noexcept;

    std::filesystem::path path_;
};

} // namespace codeauditor
