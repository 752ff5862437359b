#pragma once

#include <optional>
#include <string>
#include <vector>

namespace uberpack {

// ============================================================================
// EDN Values
// ============================================================================

// Reader descriptors (data_readers.clj/.cljc) are EDN maps from tag symbol to
// var symbol. The reader below covers the whole EDN grammar so that any
// well-formed descriptor survives a merge.

enum class EdnKind {
    Nil,
    Boolean,
    Integer,
    Float,
    String,
    Character,
    Keyword,
    Symbol,
    List,
    Vector,
    Map,
    Set,
    Tagged
};

struct EdnValue {
    EdnKind kind = EdnKind::Nil;

    // Printed form for atoms, decoded content for strings, tag name (without
    // '#') for tagged literals, character name for characters.
    std::string text;

    // Elements of collections. Maps store alternating keys and values.
    // Tagged literals hold exactly one element.
    std::vector<EdnValue> items;

    size_t map_size() const { return kind == EdnKind::Map ? items.size() / 2 : 0; }

    // Lookup in a map by key; nullptr when absent or not a map
    const EdnValue* get(const EdnValue& key) const;
};

bool operator==(const EdnValue& a, const EdnValue& b);
bool operator!=(const EdnValue& a, const EdnValue& b);

EdnValue edn_symbol(const std::string& name);
EdnValue edn_map();

// Insert or replace a map entry. Replacing keeps the key's position.
void edn_assoc(EdnValue& map, EdnValue key, EdnValue value);

// ============================================================================
// Reading
// ============================================================================

struct EdnParseResult {
    bool ok = false;
    std::string error;
    EdnValue value;
};

// Read exactly one form. Trailing content other than whitespace, commas and
// comments is an error.
EdnParseResult parse_edn(const std::string& input);

// Read a reader descriptor: a single map, or nothing at all (empty map)
EdnParseResult parse_data_readers(const std::string& input);

// ============================================================================
// Merging and Printing
// ============================================================================

// Keys of base keep their order, keys only in overlay are appended.
// On collision the overlay value wins.
EdnValue merge_edn_maps(const EdnValue& base, const EdnValue& overlay);

// Single-line printed form, e.g. {x y, z w}
std::string print_edn(const EdnValue& value);

// Pretty-printed form terminated by a newline. Maps that do not fit in
// 72 columns are broken one entry per line.
std::string pprint_edn(const EdnValue& value);

} // namespace uberpack
