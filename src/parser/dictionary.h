#ifndef MORK_PARSER_DICTIONARY_H
#define MORK_PARSER_DICTIONARY_H

#include <string>
#include <unordered_map>
#include "utils/result.h"

namespace Mork {

static constexpr auto ATOM_NAMESPACE = "a";
static constexpr auto COLUMN_NAMESPACE = "c";

// Metatable cell that overrides the default scope of the row IDs in a table.
static constexpr auto ROW_SCOPE_CELL = "r";

// A hex ID and the namespace it lives in.
struct Oid {
    std::string id;
    std::string scope;
};

/*
 * Alias tables, one per namespace, mapping hex IDs to the strings they stand for. Later definitions replace
 * earlier ones. A dictionary may be layered over a parent: lookups fall through to the parent, but definitions
 * stay in the child until it is merged with merge_into(). This is how uncommitted group edits are kept apart.
 */
class Dictionary final {
public:
    using AliasMap = std::unordered_map<std::string, std::string>;

    explicit Dictionary(std::string filename, const Dictionary *parent = nullptr);

    // Get the alias table for a namespace, creating it if it does not exist.
    [[nodiscard]] auto dictionary_for(const std::string &scope) -> AliasMap &;

    auto define(const std::string &id, const std::string &scope, std::string value) -> void;

    // Find the most recent definition of id in scope, in this dictionary or one of its parents.
    [[nodiscard]] auto find(const std::string &id, const std::string &scope) const -> const std::string *;

    [[nodiscard]] auto resolve(const std::string &id, const std::string &scope) const -> Result<std::string>;

    // Move every definition in this dictionary into target. This dictionary is left empty.
    auto merge_into(Dictionary &target) -> void;

    // Number of definitions held directly by this dictionary.
    [[nodiscard]] auto size() const -> Size;

private:
    std::unordered_map<std::string, AliasMap> m_scopes;
    std::string m_filename;
    const Dictionary *m_parent {};
};

} // namespace Mork

#endif // MORK_PARSER_DICTIONARY_H
