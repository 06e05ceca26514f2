#include "dictionary.h"
#include <spdlog/fmt/fmt.h>
#include "utils/logging.h"

namespace Mork {

Dictionary::Dictionary(std::string filename, const Dictionary *parent)
    : m_filename {std::move(filename)},
      m_parent {parent}
{}

auto Dictionary::dictionary_for(const std::string &scope) -> AliasMap &
{
    return m_scopes[scope];
}

auto Dictionary::define(const std::string &id, const std::string &scope, std::string value) -> void
{
    dictionary_for(scope).insert_or_assign(id, std::move(value));
}

auto Dictionary::find(const std::string &id, const std::string &scope) const -> const std::string *
{
    for (const auto *dictionary = this; dictionary; dictionary = dictionary->m_parent) {
        if (const auto s = dictionary->m_scopes.find(scope); s != cend(dictionary->m_scopes)) {
            if (const auto a = s->second.find(id); a != cend(s->second))
                return &a->second;
        }
    }
    return nullptr;
}

auto Dictionary::resolve(const std::string &id, const std::string &scope) const -> Result<std::string>
{
    if (const auto *value = find(id, scope))
        return *value;
    return Err {Status::unresolved_reference(
        fmt::format("{}: unresolved alias {}:{}", m_filename, escape_string(id), escape_string(scope)))};
}

auto Dictionary::merge_into(Dictionary &target) -> void
{
    for (auto &[scope, aliases]: m_scopes) {
        auto &destination = target.dictionary_for(scope);
        for (auto &[id, value]: aliases)
            destination.insert_or_assign(id, std::move(value));
    }
    m_scopes.clear();
}

auto Dictionary::size() const -> Size
{
    Size total {};
    for (const auto &[scope, aliases]: m_scopes)
        total += aliases.size();
    return total;
}

} // namespace Mork
