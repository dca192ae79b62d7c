/**
 * @file Document.cpp
 * @brief Round-trip compose tree: line splitting, parsing and serialization
 *
 * yaml-cpp gives the semantic value of the document but drops comments and
 * layout, so the source is also cut into lines. A block mapping is split by
 * locating its key lines (content lines at the block's column) and pairing
 * them positionally with the parsed mapping. When the two disagree the
 * mapping is kept as a single opaque leaf.
 */

#include "composer/Document.hpp"
#include "composer/AtomicFile.hpp"
#include "composer/Errors.hpp"
#include "composer/Logging.hpp"
#include "composer/Util.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <numeric>
#include <regex>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace composer {

// ============================================================================
// Entry / Block
// ============================================================================

Entry::Entry(const Entry& other)
    : key(other.key)
    , leading(other.leading)
    , text(other.text)
    , header(other.header)
    , value(YAML::Clone(other.value))
    , block(other.block ? std::make_unique<Block>(*other.block) : nullptr)
    , dirty(other.dirty) {}

Entry& Entry::operator=(const Entry& other) {
    if (this != &other) {
        Entry copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Entry& Entry::operator=(Entry&& other) {
    key = std::move(other.key);
    leading = std::move(other.leading);
    text = std::move(other.text);
    header = std::move(other.header);
    value.reset(other.value);
    block = std::move(other.block);
    dirty = other.dirty;
    return *this;
}

YAML::Node Entry::to_node() const {
    if (block) return block->to_node();
    return YAML::Clone(value);
}

Block::Block(Scope scope, int indent) : scope(scope), indent(indent) {}

Entry* Block::find(const std::string& key) {
    for (auto& entry : entries) {
        if (entry.key == key) return &entry;
    }
    return nullptr;
}

const Entry* Block::find(const std::string& key) const {
    for (const auto& entry : entries) {
        if (entry.key == key) return &entry;
    }
    return nullptr;
}

const Entry* Block::find_ignore_case(const std::string& key) const {
    for (const auto& entry : entries) {
        if (iequals(entry.key, key)) return &entry;
    }
    return nullptr;
}

std::vector<std::string> Block::keys() const {
    std::vector<std::string> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back(entry.key);
    }
    return result;
}

Entry& Block::set(const std::string& key, const YAML::Node& value) {
    Entry* entry = find(key);
    if (!entry) {
        entry = &append(Entry(key));
    }
    entry->value.reset(YAML::Clone(value));
    entry->block.reset();
    entry->header.clear();
    entry->text.clear();
    entry->dirty = true;
    dirty = true;
    return *entry;
}

Entry& Block::append(Entry entry) {
    entries.push_back(std::move(entry));
    dirty = true;
    return entries.back();
}

bool Block::erase(const std::string& key) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Entry& e) { return e.key == key; });
    if (it == entries.end()) return false;
    entries.erase(it);
    return true;
}

Block& Block::expand(Entry& entry, Scope child_scope, int indent_width) {
    if (entry.block) return *entry.block;

    const YAML::Node& value = entry.value;
    if (!value.IsMap() && !value.IsNull()) {
        throw ValidationError("'" + entry.key + "' is not a mapping");
    }

    auto child = std::make_unique<Block>(child_scope, indent + indent_width);
    if (value.IsMap()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!it->first.IsScalar()) {
                throw ValidationError("'" + entry.key + "' has a non-scalar key");
            }
            Entry item(it->first.Scalar());
            item.value.reset(YAML::Clone(it->second));
            item.dirty = true;
            child->entries.push_back(std::move(item));
        }
    }

    logger()->debug("expanded '{}' into {} regenerated entries", entry.key, child->entries.size());

    entry.text.clear();
    entry.header.clear();
    entry.value.reset();
    entry.dirty = false;
    entry.block = std::move(child);
    return *entry.block;
}

YAML::Node Block::to_node() const {
    YAML::Node node(YAML::NodeType::Map);
    for (const auto& entry : entries) {
        node[entry.key] = entry.to_node();
    }
    return node;
}

// ============================================================================
// ComposeTree
// ============================================================================

const Block* ComposeTree::find_section(const std::string& name) const {
    const Entry* entry = root_.find(name);
    if (!entry || !entry->block) return nullptr;
    return entry->block.get();
}

Block& ComposeTree::section(const std::string& name) {
    Entry* entry = root_.find(name);
    if (!entry) {
        Entry created(name);
        created.block = std::make_unique<Block>(Scope::Section, indent_width);
        return *root_.append(std::move(created)).block;
    }
    return root_.expand(*entry, Scope::Section, indent_width);
}

std::vector<std::string> ComposeTree::section_keys(const std::string& name) const {
    const Entry* entry = root_.find(name);
    if (!entry) return {};
    if (entry->block) return entry->block->keys();

    std::vector<std::string> result;
    if (entry->value.IsMap()) {
        for (auto it = entry->value.begin(); it != entry->value.end(); ++it) {
            if (it->first.IsScalar()) result.push_back(it->first.Scalar());
        }
    }
    return result;
}

YAML::Node ComposeTree::to_node() const {
    return root_.to_node();
}

// ============================================================================
// Line splitting
// ============================================================================

namespace {

struct Line {
    std::string text;   ///< including the line break, if any
    int indent = 0;     ///< leading spaces
    bool blank = false;
    bool comment = false;

    bool content() const { return !blank && !comment; }

    char first() const {
        return static_cast<size_t>(indent) < text.size() ? text[static_cast<size_t>(indent)] : '\0';
    }
};

std::vector<Line> split_lines(const std::string& text) {
    std::vector<Line> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        size_t stop = nl == std::string::npos ? text.size() : nl + 1;

        Line line;
        line.text = text.substr(pos, stop - pos);
        while (static_cast<size_t>(line.indent) < line.text.size() &&
               line.text[static_cast<size_t>(line.indent)] == ' ') {
            ++line.indent;
        }
        auto first = line.text.find_first_not_of(" \t\r\n");
        line.blank = first == std::string::npos;
        line.comment = !line.blank && line.text[first] == '#';
        lines.push_back(std::move(line));
        pos = stop;
    }
    return lines;
}

std::string join_lines(const std::vector<Line>& lines, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        out += lines[i].text;
    }
    return out;
}

bool is_marker(const Line& line, const char* marker) {
    if (line.indent != 0 || line.text.compare(0, 3, marker) != 0) return false;
    return line.text.size() == 3 || std::isspace(static_cast<unsigned char>(line.text[3]));
}

// `- item` at the block column: a compact sequence under the previous key
bool is_sequence_item(const Line& line) {
    if (line.first() != '-') return false;
    size_t next = static_cast<size_t>(line.indent) + 1;
    return next >= line.text.size() ||
           std::isspace(static_cast<unsigned char>(line.text[next]));
}

bool starts_like_key(const Line& line) {
    static const std::string kNotKey = "?{}[],";
    return kNotKey.find(line.first()) == std::string::npos && !is_sequence_item(line);
}

/// Scope of the block under `key`, if that value should be split at all
bool child_scope_for(Scope scope, Scope entity_scope, const std::string& key,
                     Scope& child, Scope& child_entity) {
    if (scope == Scope::Root) {
        if (key == "services") {
            child = Scope::Section;
            child_entity = Scope::Service;
            return true;
        }
        if (key == "networks") {
            child = Scope::Section;
            child_entity = Scope::Network;
            return true;
        }
        return false;
    }
    if (scope == Scope::Section) {
        child = entity_scope;
        child_entity = entity_scope;
        return true;
    }
    return false;
}

/**
 * @brief Split lines [begin, end) holding the block mapping `node`
 *
 * For the root block `preamble` receives the lines before the first key's
 * comment block; nested blocks give their first entry every line from
 * `begin`. `out` is only assigned on success.
 */
bool split_block(const std::vector<Line>& lines, size_t begin, size_t end,
                 const YAML::Node& node, int parent_indent, Scope scope,
                 Scope entity_scope, Block& out, std::string* preamble) {
    size_t first = begin;
    while (first < end && !lines[first].content()) ++first;
    if (first == end) return false;

    const int block_indent = lines[first].indent;
    if (block_indent <= parent_indent || !starts_like_key(lines[first])) return false;

    std::vector<size_t> key_lines;
    for (size_t i = first; i < end; ++i) {
        const Line& line = lines[i];
        if (!line.content()) continue;
        if (line.indent < block_indent) return false;
        if (line.indent > block_indent || is_sequence_item(line)) continue;
        if (!starts_like_key(line)) return false;
        key_lines.push_back(i);
    }
    if (key_lines.size() != node.size()) return false;

    auto loose = [&](const Line& line) {
        return line.blank || (line.comment && line.indent <= block_indent);
    };

    // Where each entry starts: its key line, minus the comments above it
    std::vector<size_t> starts(key_lines.size());
    for (size_t j = 0; j < key_lines.size(); ++j) {
        size_t floor = j == 0 ? begin : key_lines[j - 1] + 1;
        size_t s = key_lines[j];
        if (j == 0 && !preamble) {
            s = begin;
        } else if (j == 0) {
            while (s > floor && lines[s - 1].comment && lines[s - 1].indent <= block_indent) --s;
        } else {
            while (s > floor && loose(lines[s - 1])) --s;
        }
        starts[j] = s;
    }

    size_t tail = end;
    while (tail > key_lines.back() + 1 && loose(lines[tail - 1])) --tail;

    Block block(scope, block_indent);
    size_t j = 0;
    for (auto it = node.begin(); it != node.end(); ++it, ++j) {
        if (!it->first.IsScalar()) return false;
        const std::string key = it->first.Scalar();
        const Line& key_line = lines[key_lines[j]];
        const std::string rest = key_line.text.substr(static_cast<size_t>(key_line.indent));
        if (!starts_with(rest, key) && rest[0] != '"' && rest[0] != '\'') return false;

        const size_t body_end = j + 1 < key_lines.size() ? starts[j + 1] : tail;

        Entry entry(key);
        entry.leading = join_lines(lines, starts[j], key_lines[j]);

        const YAML::Node value = it->second;
        Scope child_scope = Scope::Root;
        Scope child_entity = Scope::Root;
        if (value.IsMap() && value.size() > 0 &&
            child_scope_for(scope, entity_scope, key, child_scope, child_entity)) {
            auto child = std::make_unique<Block>();
            if (split_block(lines, key_lines[j] + 1, body_end, value, block_indent,
                            child_scope, child_entity, *child, nullptr)) {
                entry.header = key_line.text;
                entry.block = std::move(child);
                block.entries.push_back(std::move(entry));
                continue;
            }
            logger()->debug("'{}' kept as one entry: layout not recognized", key);
        }

        entry.text = join_lines(lines, key_lines[j], body_end);
        entry.value.reset(YAML::Clone(value));
        block.entries.push_back(std::move(entry));
    }

    block.trailer = join_lines(lines, tail, end);
    if (preamble) *preamble = join_lines(lines, begin, starts[0]);
    out = std::move(block);
    return true;
}

void check_section_shape(const YAML::Node& doc, const char* name, const std::string& origin) {
    const YAML::Node& cdoc = doc;
    const YAML::Node section = cdoc[name];
    if (!section.IsDefined() || section.IsNull() || section.IsMap()) return;
    throw ParseError(origin, section.Mark().line + 1, section.Mark().column + 1,
                     std::string("'") + name + "' must be a mapping");
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

ComposeTree parse_compose(const std::string& text, const std::string& origin) {
    ComposeTree tree;
    tree.origin = origin;

    YAML::Node doc;
    try {
        doc.reset(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw ParseError(origin, e.mark.line + 1, e.mark.column + 1, e.msg);
    }

    const std::vector<Line> lines = split_lines(text);

    // Document markers: a leading `---` belongs to the preamble, a closing
    // `...` and what follows to the trailer; a second document is rejected.
    size_t body_begin = 0;
    size_t body_end = lines.size();
    bool has_content = false;
    for (size_t i = 0; i < lines.size(); ++i) {
        const Line& line = lines[i];
        if (!line.content()) continue;
        if (is_marker(line, "---")) {
            if (has_content || body_end != lines.size()) {
                throw ParseError(origin, static_cast<int>(i) + 1, 1,
                                 "multiple YAML documents are not supported");
            }
            body_begin = i + 1;
            continue;
        }
        if (is_marker(line, "...")) {
            if (body_end == lines.size()) body_end = i;
            continue;
        }
        if (body_end != lines.size()) {
            throw ParseError(origin, static_cast<int>(i) + 1, 1,
                             "multiple YAML documents are not supported");
        }
        has_content = true;
    }

    if (!has_content) {
        tree.preamble = text;
        logger()->debug("{}: no content, empty document", origin);
        return tree;
    }
    if (!doc.IsMap()) {
        throw ParseError(origin, doc.Mark().line + 1, doc.Mark().column + 1,
                         "top-level value must be a mapping");
    }
    check_section_shape(doc, "services", origin);
    check_section_shape(doc, "networks", origin);

    Block root(Scope::Root, 0);
    std::string preamble;
    if (split_block(lines, body_begin, body_end, doc, -1, Scope::Root, Scope::Root,
                    root, &preamble)) {
        root.trailer += join_lines(lines, body_end, lines.size());
        tree.preamble = join_lines(lines, 0, body_begin) + preamble;
    } else {
        // Keep the values, lose the layout
        logger()->warn("{}: layout not recognized, the document will be rewritten", origin);
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (!it->first.IsScalar()) {
                throw ParseError(origin, it->first.Mark().line + 1, it->first.Mark().column + 1,
                                 "top-level keys must be scalars");
            }
            Entry entry(it->first.Scalar());
            entry.value.reset(YAML::Clone(it->second));
            entry.dirty = true;
            root.entries.push_back(std::move(entry));
        }
        size_t first = 0;
        while (first < lines.size() && !lines[first].content()) ++first;
        tree.preamble = join_lines(lines, 0, first);
    }
    tree.root() = std::move(root);

    if (const Block* services = tree.find_section("services")) {
        tree.indent_width = services->indent;
    } else if (const Block* networks = tree.find_section("networks")) {
        tree.indent_width = networks->indent;
    }
    tree.indent_width = std::max(2, tree.indent_width);

    logger()->debug("{}: {} top-level keys, indent {}", origin, tree.root().entries.size(),
                    tree.indent_width);
    return tree;
}

ComposeTree load_compose_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw FileNotFoundError(path);
    }
    if (fs::is_directory(path, ec)) {
        throw IOError(path, "is a directory");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError(path, "cannot open for reading");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw IOError(path, "read failed");
    }

    logger()->debug("loading {}", path);
    return parse_compose(buffer.str(), path);
}

std::optional<ComposeTree> try_load_compose_file(const std::string& path) {
    try {
        return load_compose_file(path);
    } catch (const FileNotFoundError&) {
        logger()->debug("{} does not exist yet", path);
        return std::nullopt;
    }
}

// ============================================================================
// Writing
// ============================================================================

namespace {

// Scalars yaml-cpp would write plain but a reader would not take as a string
bool is_ambiguous_scalar(const std::string& s) {
    static const std::set<std::string> kWords = {
        "", "~", "null", "true", "false", "yes", "no", "on", "off", "y", "n"};
    static const std::regex kNumber(
        R"(^[-+]?(\.[0-9]+|[0-9][0-9_]*(\.[0-9]*)?)([eE][-+]?[0-9]+)?$)");
    static const std::regex kRadix(R"(^0(x[0-9a-fA-F_]+|o[0-7_]+|b[01_]+)$)");
    static const std::regex kSpecial(R"(^[-+]?\.(inf|nan)$)");
    static const std::regex kSexagesimal(R"(^[-+]?[0-9]+(:[0-5]?[0-9])+(\.[0-9]*)?$)");

    const std::string lower = to_lower(s);
    return kWords.count(lower) > 0 || std::regex_match(s, kNumber) ||
           std::regex_match(s, kRadix) || std::regex_match(lower, kSpecial) ||
           std::regex_match(s, kSexagesimal);
}

void emit_string(YAML::Emitter& em, const std::string& s) {
    if (is_ambiguous_scalar(s)) {
        em << YAML::DoubleQuoted << s;
    } else {
        em << s;
    }
}

void emit_scalar(YAML::Emitter& em, const YAML::Node& node) {
    const std::string& tag = node.Tag();
    const std::string& s = node.Scalar();
    if (tag == "!") {
        em << YAML::DoubleQuoted << s;
    } else if (tag == "?") {
        em << s;
    } else if (tag.empty() || tag == "tag:yaml.org,2002:str") {
        emit_string(em, s);
    } else {
        em << YAML::VerbatimTag(tag) << s;
    }
}

void emit_value(YAML::Emitter& em, const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        emit_scalar(em, node);
        break;
    case YAML::NodeType::Sequence:
        if (node.Style() == YAML::EmitterStyle::Flow || node.size() == 0) em << YAML::Flow;
        em << YAML::BeginSeq;
        for (const auto& item : node) {
            emit_value(em, item);
        }
        em << YAML::EndSeq;
        break;
    case YAML::NodeType::Map:
        if (node.Style() == YAML::EmitterStyle::Flow || node.size() == 0) em << YAML::Flow;
        em << YAML::BeginMap;
        for (auto it = node.begin(); it != node.end(); ++it) {
            em << YAML::Key;
            emit_value(em, it->first);
            em << YAML::Value;
            emit_value(em, it->second);
        }
        em << YAML::EndMap;
        break;
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        em << YAML::Null;
        break;
    }
}

std::string indent_lines(const std::string& text, int indent) {
    const std::string pad(static_cast<size_t>(indent), ' ');
    std::string out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out += pad;
        out += line;
        out += '\n';
    }
    return out;
}

// Rendered text nests by 2; each nesting level becomes `width` columns. The
// content after a "- " indicator keeps its offset so compact mappings line up.
std::string widen_indent(const std::string& text, int width) {
    if (width <= 2) return text;
    std::vector<std::pair<size_t, size_t>> columns{{0, 0}};
    std::string out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const size_t col = line.find_first_not_of(' ');
        if (col == std::string::npos) {
            out += '\n';
            continue;
        }
        while (columns.back().first > col) columns.pop_back();
        if (columns.back().first < col) {
            columns.emplace_back(col, columns.back().second + static_cast<size_t>(width));
        }
        const size_t widened = columns.back().second;
        size_t at = col;
        size_t to = widened;
        while (line.compare(at, 2, "- ") == 0) {
            at += 2;
            to += 2;
            columns.emplace_back(at, to);
        }
        out += std::string(widened, ' ');
        out += line.substr(col);
        out += '\n';
    }
    return out;
}

std::string format_key(const std::string& key) {
    YAML::Emitter em;
    emit_string(em, key);
    return em.c_str();
}

// Verbatim pieces may lack a final newline (last line of a file)
void append(std::string& out, const std::string& piece) {
    if (piece.empty()) return;
    if (!out.empty() && out.back() != '\n') out += '\n';
    out += piece;
}

void write_block(const Block& block, int indent_width, std::string& out);

void write_entry(const Entry& entry, int indent, int indent_width, std::string& out) {
    append(out, entry.leading);

    if (entry.block) {
        if (entry.block->entries.empty()) {
            append(out, std::string(static_cast<size_t>(indent), ' ') + format_key(entry.key) + ": {}\n");
            return;
        }
        if (!entry.header.empty()) {
            append(out, entry.header);
        } else {
            append(out, std::string(static_cast<size_t>(indent), ' ') + format_key(entry.key) + ":\n");
        }
        write_block(*entry.block, indent_width, out);
        return;
    }

    if (!entry.dirty) {
        append(out, entry.text);
    } else {
        append(out, render_entry(entry.key, entry.value, indent, indent_width));
    }
}

void write_block(const Block& block, int indent_width, std::string& out) {
    std::vector<std::size_t> order;
    if (block.dirty) {
        order = canonical_order(block.scope, block.keys());
    } else {
        order.resize(block.entries.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
    }
    for (std::size_t index : order) {
        write_entry(block.entries[index], block.indent, indent_width, out);
    }
    append(out, block.trailer);
}

} // namespace

std::string render_entry(const std::string& key, const YAML::Node& value,
                         int indent, int indent_width) {
    // Wider emitter indents pad sequence items ("-   a"); widen afterwards
    YAML::Emitter em;
    em.SetIndent(2);
    em << YAML::BeginMap << YAML::Key;
    emit_string(em, key);
    em << YAML::Value;
    emit_value(em, value);
    em << YAML::EndMap;
    if (!em.good()) {
        throw ComposeError("cannot render '" + key + "': " + em.GetLastError());
    }
    return indent_lines(widen_indent(em.c_str(), indent_width), indent);
}

YAML::Node plain_scalar(const std::string& text) {
    YAML::Node node(text);
    node.SetTag("?");
    return node;
}

std::string serialize(const ComposeTree& tree) {
    std::string out = tree.preamble;
    write_block(tree.root(), tree.indent_width, out);
    return out;
}

void write_compose_file(const ComposeTree& tree, const std::string& path) {
    const std::string text = serialize(tree);
    atomic_write_file(path, text);
    logger()->info("wrote {}", path);
}

void init_compose_file(const std::string& path) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        throw IOError(path, "file already exists");
    }
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw IOError(path, "cannot create directory '" + parent.string() + "': " + ec.message());
        }
    }
    atomic_write_file(path, "services: {}\nnetworks: {}\n");
    logger()->info("initialized {}", path);
}

} // namespace composer
