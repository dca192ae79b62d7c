/**
 * @file Errors.hpp
 * @brief Exception types for compose document errors
 *
 * Error taxonomy:
 * - ComposeError: Base class
 * - FileNotFoundError: Compose or settings file absent (NotFound)
 * - ParseError: Malformed YAML/JSON/TOML, or a YAML root that is not a mapping
 * - ValidationError: Rejected merge request (referential integrity, duplicates)
 * - UnknownPresetError: Preset name not in the preset table
 * - IOError: Write or rename failure
 */

#ifndef COMPOSER_ERRORS_HPP
#define COMPOSER_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace composer {

/**
 * @brief Base class for all composer exceptions
 */
class ComposeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief File not found
 *
 * A missing compose file is a normal first-run outcome; callers that can
 * start from an empty document use try_load_compose_file() instead.
 */
class FileNotFoundError : public ComposeError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ComposeError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Parse error (YAML/JSON/TOML syntax or wrong root shape)
 */
class ParseError : public ComposeError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path (or origin label) of the text with the error
     * @param line 1-based line, 0 when unknown
     * @param column 1-based column, 0 when unknown
     * @param details Detailed error message from the parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : ComposeError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line;
            if (column > 0) oss << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Merge request rejected before any mutation
 *
 * Carries every issue found, not only the first one.
 */
class ValidationError : public ComposeError {
public:
    explicit ValidationError(std::vector<std::string> issues)
        : ComposeError(format_message(issues))
        , issues_(std::move(issues))
    {}

    explicit ValidationError(const std::string& issue)
        : ValidationError(std::vector<std::string>{issue})
    {}

    /**
     * @brief Get the list of issues
     */
    const std::vector<std::string>& issues() const noexcept {
        return issues_;
    }

private:
    std::vector<std::string> issues_;

    static std::string format_message(const std::vector<std::string>& issues) {
        std::ostringstream oss;
        oss << "Validation failed: ";
        for (size_t i = 0; i < issues.size(); ++i) {
            if (i > 0) oss << "; ";
            oss << issues[i];
        }
        return oss.str();
    }
};

/**
 * @brief Preset name not present in the preset table
 */
class UnknownPresetError : public ComposeError {
public:
    UnknownPresetError(std::string preset, std::vector<std::string> known)
        : ComposeError(format_message(preset, known))
        , preset_(std::move(preset))
        , known_(std::move(known))
    {}

    const std::string& preset() const noexcept {
        return preset_;
    }

    /**
     * @brief Names that would have resolved
     */
    const std::vector<std::string>& known() const noexcept {
        return known_;
    }

private:
    std::string preset_;
    std::vector<std::string> known_;

    static std::string format_message(const std::string& preset,
                                      const std::vector<std::string>& known) {
        std::ostringstream oss;
        oss << "Unknown resource preset '" << preset << "' (known: ";
        for (size_t i = 0; i < known.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << known[i];
        }
        oss << ")";
        return oss.str();
    }
};

/**
 * @brief Write, flush or rename failure
 *
 * The target file is left as it was before the failed write.
 */
class IOError : public ComposeError {
public:
    IOError(std::string path, std::string details)
        : ComposeError("I/O error on '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;
};

} // namespace composer

#endif // COMPOSER_ERRORS_HPP
