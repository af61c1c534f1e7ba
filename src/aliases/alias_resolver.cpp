/// @file src/aliases/alias_resolver.cpp
/// @brief AliasTable lookups and AliasResolver copy-and-swap updates.

#include "vitalog/aliases.hpp"

#include "../util/text.hpp"

#include <utility>

namespace vitalog::aliases {

// ─── AliasTable ───────────────────────────────────────────────────────────────

AliasTable::AliasTable(AliasMap categories, std::uint64_t version)
    : categories_(std::move(categories))
    , version_(version)
{}

std::string AliasTable::resolve(std::string_view category, std::string_view term) const {
    const CategoryMap& mapping = this->category(category);
    const auto it = mapping.find(term);
    if (it == mapping.end()) {
        return std::string(term);
    }
    return it->second;
}

const CategoryMap& AliasTable::category(std::string_view name) const noexcept {
    static const CategoryMap empty;
    const auto it = categories_.find(name);
    return it == categories_.end() ? empty : it->second;
}

std::vector<AliasMatch> AliasTable::search(std::string_view term) const {
    const std::string needle = util::to_lower(term);
    std::vector<AliasMatch> matches;

    for (const auto& [category, mapping] : categories_) {
        for (const auto& [abbreviation, canonical] : mapping) {
            if (util::to_lower(abbreviation).find(needle) != std::string::npos ||
                util::to_lower(canonical).find(needle) != std::string::npos) {
                matches.push_back(AliasMatch{
                    .category     = category,
                    .abbreviation = abbreviation,
                    .canonical    = canonical,
                });
            }
        }
    }
    return matches;
}

// ─── AliasResolver ────────────────────────────────────────────────────────────

AliasResolver::AliasResolver(AliasMap initial)
    : table_(std::make_shared<const AliasTable>(std::move(initial), 1))
{}

std::string AliasResolver::resolve(std::string_view category, std::string_view term) const {
    return snapshot()->resolve(category, term);
}

std::shared_ptr<const AliasTable> AliasResolver::snapshot() const noexcept {
    return table_.load(std::memory_order_acquire);
}

std::uint64_t AliasResolver::install(AliasMap next) {
    const std::uint64_t version = table_.load(std::memory_order_relaxed)->version() + 1;
    table_.store(std::make_shared<const AliasTable>(std::move(next), version),
                 std::memory_order_release);
    return version;
}

std::uint64_t AliasResolver::reload(AliasMap replacement) {
    std::lock_guard lock(write_mutex_);
    return install(std::move(replacement));
}

bool AliasResolver::add(std::string_view category, std::string_view abbreviation,
                        std::string_view canonical) {
    std::lock_guard lock(write_mutex_);

    AliasMap next = table_.load(std::memory_order_relaxed)->categories();
    auto& mapping = next[std::string(category)];
    if (mapping.contains(abbreviation)) {
        return false;
    }
    mapping.emplace(std::string(abbreviation), std::string(canonical));

    install(std::move(next));
    return true;
}

bool AliasResolver::remove(std::string_view category, std::string_view abbreviation) {
    std::lock_guard lock(write_mutex_);

    AliasMap next = table_.load(std::memory_order_relaxed)->categories();
    const auto cat = next.find(category);
    if (cat == next.end()) {
        return false;
    }
    const auto it = cat->second.find(abbreviation);
    if (it == cat->second.end()) {
        return false;
    }
    cat->second.erase(it);

    install(std::move(next));
    return true;
}

std::vector<AliasMatch> AliasResolver::search(std::string_view term) const {
    return snapshot()->search(term);
}

} // namespace vitalog::aliases
