/**
 * @file Document.hpp
 * @brief Round-trip compose document tree, loader and writer
 *
 * A ComposeTree keeps the source text of every entry it did not change.
 * The root mapping, the `services:` and `networks:` sections and every
 * service/network block are split into entries; everything below that
 * (a service's `ports`, `deploy`, ...) is one leaf entry holding its
 * verbatim text and its parsed value.
 *
 * Writing concatenates, per entry, the blank/comment lines that preceded it
 * and either its verbatim text (untouched) or text re-rendered from its value
 * (dirty). A block flagged dirty is written in canonical key order
 * (see Ordering.hpp); other blocks keep their original order. Serializing a
 * tree nobody modified reproduces the input byte for byte.
 *
 * Layouts the splitter cannot match line-for-line with the parsed mapping
 * (flow style, multi-line flow collections, complex keys) stay opaque
 * leaves; Block::expand() turns such a leaf into a regenerated block when an
 * edit has to reach inside it.
 */

#ifndef COMPOSER_DOCUMENT_HPP
#define COMPOSER_DOCUMENT_HPP

#include "composer/Ordering.hpp"

#include <yaml-cpp/yaml.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace composer {

struct Entry;

/**
 * @brief A block mapping: ordered entries plus trailing comment lines
 */
class Block {
public:
    Block() = default;
    Block(Scope scope, int indent);

    Scope scope = Scope::Root;
    int indent = 0;              ///< column of this block's keys
    std::vector<Entry> entries;  ///< source order; new entries are appended
    std::string trailer;         ///< blank/comment lines after the last entry
    bool dirty = false;          ///< write entries in canonical order

    Entry* find(const std::string& key);
    const Entry* find(const std::string& key) const;

    /**
     * @brief Entry whose key equals `key` ignoring case, if any
     */
    const Entry* find_ignore_case(const std::string& key) const;

    std::vector<std::string> keys() const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    /**
     * @brief Set a leaf value, creating the entry if needed; marks the entry and block dirty
     */
    Entry& set(const std::string& key, const YAML::Node& value);

    /**
     * @brief Append a new entry and mark the block dirty
     */
    Entry& append(Entry entry);

    /**
     * @brief Remove an entry and its leading comment lines
     * @return false if the key was not present
     */
    bool erase(const std::string& key);

    /**
     * @brief Make `entry` (a child of this block) a split block of `child_scope`
     *
     * Leaf values that are mappings (or null) become regenerated entries;
     * an entry that is already a block is returned unchanged.
     *
     * @throws ValidationError if the entry's value is a scalar or sequence
     */
    Block& expand(Entry& entry, Scope child_scope, int indent_width);

    /**
     * @brief Semantic value of the block, entries in source order
     */
    YAML::Node to_node() const;
};

/**
 * @brief One key of a Block with its source text
 */
struct Entry {
    std::string key;
    std::string leading;          ///< verbatim blank/comment lines above the key line
    std::string text;             ///< verbatim key line and body (leaf entries)
    std::string header;           ///< verbatim key line (block entries), empty when generated
    YAML::Node value;             ///< parsed value (leaf entries)
    std::unique_ptr<Block> block; ///< set for split service/network/section blocks
    bool dirty = false;           ///< leaf: render from `value` instead of `text`

    Entry() = default;
    explicit Entry(std::string k) : key(std::move(k)) {}

    // Deep copy: YAML::Node copies would otherwise share the node
    Entry(const Entry& other);
    Entry& operator=(const Entry& other);
    Entry(Entry&&) = default;
    // Rebinds `value`; YAML::Node::operator= would write through to the old node
    Entry& operator=(Entry&& other);

    bool is_block() const noexcept { return block != nullptr; }

    /// Semantic value, whether leaf or block
    YAML::Node to_node() const;
};

/**
 * @brief Editable compose document
 */
class ComposeTree {
public:
    ComposeTree() : root_(Scope::Root, 0) {}

    Block& root() noexcept { return root_; }
    const Block& root() const noexcept { return root_; }

    /// Text before the first top-level key (comments, `---`)
    std::string preamble;

    /// Indentation step detected from the document, used for generated text
    int indent_width = 2;

    /// Path or label the tree was parsed from, for messages
    std::string origin;

    /**
     * @brief Split block of a top-level section, or nullptr if absent or opaque
     */
    const Block* find_section(const std::string& name) const;

    /**
     * @brief Split block of a top-level section, creating or expanding it
     */
    Block& section(const std::string& name);

    /**
     * @brief Names of the entries of a top-level mapping section (services, networks)
     */
    std::vector<std::string> section_keys(const std::string& name) const;

    /**
     * @brief Semantic value of the whole document
     */
    YAML::Node to_node() const;

    bool empty() const noexcept { return root_.entries.empty(); }

private:
    Block root_;
};

// ============================================================================
// Loading
// ============================================================================

/**
 * @brief Parse compose text into a tree
 *
 * Empty or comment-only text gives an empty tree that keeps the text as its
 * preamble.
 *
 * @param text YAML text
 * @param origin Path or label used in error messages
 * @throws ParseError if the text is not well-formed YAML, holds more than one
 *         document, its root is not a mapping, or `services`/`networks` is
 *         neither a mapping nor empty
 */
ComposeTree parse_compose(const std::string& text, const std::string& origin = "<memory>");

/**
 * @brief Load and parse a compose file
 * @throws FileNotFoundError if the file does not exist
 * @throws ParseError see parse_compose()
 * @throws IOError if the file exists but cannot be read
 */
ComposeTree load_compose_file(const std::string& path);

/**
 * @brief load_compose_file() with NotFound mapped to std::nullopt
 */
std::optional<ComposeTree> try_load_compose_file(const std::string& path);

// ============================================================================
// Writing
// ============================================================================

/**
 * @brief Render a tree to YAML text
 */
std::string serialize(const ComposeTree& tree);

/**
 * @brief Serialize and atomically replace `path`
 *
 * Serialization happens before the temporary file is created, and the
 * temporary file only replaces `path` once fully written and synced.
 *
 * @throws IOError if the file cannot be written or renamed; `path` is untouched
 */
void write_compose_file(const ComposeTree& tree, const std::string& path);

/**
 * @brief Write an empty `services: {}` / `networks: {}` document
 *
 * Creates missing parent directories.
 *
 * @throws IOError if `path` already exists or cannot be written
 */
void init_compose_file(const std::string& path);

/**
 * @brief Render `key: value` at a given indentation
 *
 * Scalars that would read back as something other than a string (booleans,
 * null, numbers) are double-quoted unless the node carries the plain tag "?".
 */
std::string render_entry(const std::string& key, const YAML::Node& value,
                         int indent, int indent_width);

/**
 * @brief A string scalar written without quotes regardless of its content
 *
 * Used for values that are meant as YAML booleans or numbers.
 */
YAML::Node plain_scalar(const std::string& text);

} // namespace composer

#endif // COMPOSER_DOCUMENT_HPP
