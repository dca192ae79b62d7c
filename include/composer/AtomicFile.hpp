/**
 * @file AtomicFile.hpp
 * @brief Scoped temporary file that atomically replaces its target
 *
 * Content goes to `<target>.tmp.<random>` in the target's directory.
 * commit() flushes, fsyncs, renames over the target and fsyncs the
 * directory. If commit() is never reached (exception, early return) the
 * destructor removes the temporary file, so the target is either the old
 * content or the complete new content.
 */

#ifndef COMPOSER_ATOMICFILE_HPP
#define COMPOSER_ATOMICFILE_HPP

#include <string>

namespace composer {

class AtomicFile {
public:
    /**
     * @brief Create the temporary file next to `target`
     * @throws IOError if the temporary file cannot be created
     */
    explicit AtomicFile(std::string target);
    ~AtomicFile();

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    /**
     * @brief Append bytes to the temporary file
     * @throws IOError on a short or failed write
     */
    void write(const std::string& content);

    /**
     * @brief fsync, rename over the target, fsync the directory
     * @throws IOError on failure; the temporary file is removed and the target untouched
     */
    void commit();

    const std::string& target() const noexcept { return target_; }
    const std::string& temp_path() const noexcept { return temp_path_; }
    bool committed() const noexcept { return committed_; }

private:
    std::string target_;
    std::string temp_path_;
    int fd_ = -1;
    bool committed_ = false;

    void discard() noexcept;
};

/**
 * @brief Replace `path` with `content` through an AtomicFile
 * @throws IOError
 */
void atomic_write_file(const std::string& path, const std::string& content);

} // namespace composer

#endif // COMPOSER_ATOMICFILE_HPP
