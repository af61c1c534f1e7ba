#pragma once

/// @file include/vitalog/aliases.hpp
/// @brief AliasResolver: abbreviation → canonical term lookup per category.
///
/// # Module: Alias Resolver
///
/// ## Responsibility
/// Map user shorthand (`sq`, `pp`, `fitbit`) to canonical terms (`squat`,
/// `postprandial`, `oura`) within a category (`exercises`, `hrv_metrics`,
/// `conditions`, `tags`). A miss is the identity: unknown terms pass through.
///
/// ## Snapshots and Reload
/// The tables live in an immutable AliasTable. `reload()` builds a fresh
/// table and swaps it in atomically; the old table stays alive for as long
/// as any reader still holds its snapshot. A reader therefore sees either the
/// old or the new mapping, never a half-updated one.
///
/// ## NOT Responsible For
/// - Reading or writing alias files (see vitalog/alias_config.hpp)
/// - Checking that canonical terms are meaningful to the caller

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace vitalog::aliases {

/// abbreviation → canonical term, for one category.
using CategoryMap = std::map<std::string, std::string, std::less<>>;

/// category → CategoryMap.
using AliasMap = std::map<std::string, CategoryMap, std::less<>>;

/// One hit of AliasTable::search().
struct AliasMatch {
    std::string category;
    std::string abbreviation;
    std::string canonical;
};

// ─── AliasTable ───────────────────────────────────────────────────────────────

/// Immutable, versioned alias mapping.
class AliasTable {
public:
    AliasTable(AliasMap categories, std::uint64_t version);

    /// Canonical term for `term`, or `term` itself when unmapped.
    [[nodiscard]] std::string resolve(std::string_view category,
                                      std::string_view term) const;

    /// Mapping for `category`; an empty map for an unknown category.
    [[nodiscard]] const CategoryMap& category(std::string_view name) const noexcept;

    /// Every alias whose abbreviation or canonical term contains `term`
    /// (case-insensitive), ordered by category then abbreviation.
    [[nodiscard]] std::vector<AliasMatch> search(std::string_view term) const;

    [[nodiscard]] const AliasMap& categories() const noexcept { return categories_; }
    [[nodiscard]] std::uint64_t version() const noexcept { return version_; }

private:
    AliasMap      categories_;
    std::uint64_t version_;
};

// ─── AliasResolver ────────────────────────────────────────────────────────────

/// Owner of the current AliasTable.
///
/// Reads (`resolve`, `snapshot`) are lock-free. Writers are serialized among
/// themselves; `add`/`remove` copy the current map, edit the copy and swap it
/// in, so they never mutate a table a reader can see.
class AliasResolver {
public:
    explicit AliasResolver(AliasMap initial = {});

    AliasResolver(const AliasResolver&) = delete;
    AliasResolver& operator=(const AliasResolver&) = delete;

    /// Shorthand for `snapshot()->resolve(category, term)`.
    [[nodiscard]] std::string resolve(std::string_view category,
                                      std::string_view term) const;

    /// The table in force right now. Hold it for the duration of one
    /// operation to get a consistent view.
    [[nodiscard]] std::shared_ptr<const AliasTable> snapshot() const noexcept;

    /// Replace every mapping at once.
    ///
    /// # Returns
    /// The version number of the newly installed table.
    std::uint64_t reload(AliasMap replacement);

    /// Add `abbreviation → canonical` to `category`.
    ///
    /// # Returns
    /// `false` (and changes nothing) if the abbreviation is already mapped in
    /// that category; remove it first to replace it.
    bool add(std::string_view category, std::string_view abbreviation,
             std::string_view canonical);

    /// Remove an abbreviation from `category`.
    ///
    /// # Returns
    /// `false` if it was not mapped.
    bool remove(std::string_view category, std::string_view abbreviation);

    /// See AliasTable::search().
    [[nodiscard]] std::vector<AliasMatch> search(std::string_view term) const;

private:
    /// Install `next` as a new version. Caller holds `write_mutex_`.
    std::uint64_t install(AliasMap next);

    std::atomic<std::shared_ptr<const AliasTable>> table_;
    std::mutex                                     write_mutex_;
};

} // namespace vitalog::aliases
