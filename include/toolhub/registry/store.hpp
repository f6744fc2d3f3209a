#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "toolhub/backend/connector.hpp"
#include "toolhub/core/error.hpp"
#include "toolhub/registry/registry.hpp"

namespace toolhub::registry {

using boost::asio::awaitable;

/// Outcome of reading a registry file. `error` is set only when neither the
/// file nor its backup could be used; `registry` is then empty.
struct LoadResult {
    Registry registry;
    bool recovered_from_backup = false;
    std::optional<Error> error;
};

/// Holds the live registry snapshot and its on-disk copy.
///
/// Readers take `current()` and keep using that snapshot for as long as
/// they need it; `replace()` swaps in a new one without blocking them.
class RegistryStore {
public:
    RegistryStore(std::filesystem::path path, std::set<std::string> known_backends);

    [[nodiscard]] auto current() const -> std::shared_ptr<const Registry>;

    /// Installs `next` and returns the snapshot it replaced.
    auto replace(Registry next) -> std::shared_ptr<const Registry>;

    /// Asks every ready or degraded connector for its catalog and merges the
    /// results. A connector that fails to list keeps the tools it owns in the
    /// live snapshot and is remembered in `unlisted_backends()` until a later
    /// rebuild lists it. Does not install or persist anything.
    auto rebuild(const std::vector<backend::ConnectorPtr>& connectors)
        -> awaitable<Result<Registry>>;

    /// Serving backends whose catalog the last rebuild could not fetch.
    [[nodiscard]] auto unlisted_backends() const -> std::set<std::string>;

    auto persist(const Registry& registry) const -> VoidResult;
    auto load() const -> LoadResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto known_backends() const -> const std::set<std::string>& {
        return known_backends_;
    }

    /// Writes `path.bak` from the existing file (best-effort), then replaces
    /// `path` through a temporary file and rename.
    static auto persist(const Registry& registry, const std::filesystem::path& path)
        -> VoidResult;

    /// Reads `path`, falling back once to `path.bak`.
    static auto load(const std::filesystem::path& path,
                     const std::set<std::string>& known_backends) -> LoadResult;

    /// Reads and validates a single file with no fallback.
    static auto read_file(const std::filesystem::path& path,
                          const std::set<std::string>& known_backends) -> Result<Registry>;

private:
    std::filesystem::path path_;
    std::set<std::string> known_backends_;
    std::atomic<std::shared_ptr<const Registry>> current_;
    mutable std::mutex unlisted_mutex_;
    std::set<std::string> unlisted_;
};

auto backup_path(const std::filesystem::path& path) -> std::filesystem::path;

} // namespace toolhub::registry
