#include "toolhub/registry/store.hpp"
#include "toolhub/core/logger.hpp"

#include <fstream>
#include <stdexcept>

namespace toolhub::registry {

auto backup_path(const std::filesystem::path& path) -> std::filesystem::path {
    return std::filesystem::path(path.string() + ".bak");
}

RegistryStore::RegistryStore(std::filesystem::path path, std::set<std::string> known_backends)
    : path_(std::move(path)),
      known_backends_(std::move(known_backends)),
      current_(std::make_shared<const Registry>()) {}

auto RegistryStore::current() const -> std::shared_ptr<const Registry> {
    return current_.load(std::memory_order_acquire);
}

auto RegistryStore::replace(Registry next) -> std::shared_ptr<const Registry> {
    auto snapshot = std::make_shared<const Registry>(std::move(next));
    return current_.exchange(std::move(snapshot), std::memory_order_acq_rel);
}

auto RegistryStore::rebuild(const std::vector<backend::ConnectorPtr>& connectors)
    -> awaitable<Result<Registry>> {
    auto previous = current();
    std::vector<BackendCatalog> catalogs;
    std::set<std::string> unlisted;
    for (const auto& connector : connectors) {
        if (!backend::accepts_calls(connector->status())) {
            LOG_DEBUG("Rebuild: skipping backend {} ({})", connector->id(),
                      backend::backend_status_to_string(connector->status()));
            continue;
        }
        auto tools = co_await connector->list_tools();
        if (!tools) {
            BackendCatalog kept{connector->id(), {}};
            for (const auto& tool : previous->tools()) {
                if (tool.owner_id == connector->id()) {
                    kept.tools.push_back(tool);
                }
            }
            LOG_WARN("Rebuild: backend {} did not list tools ({}); keeping its {} known tools",
                     connector->id(), tools.error().what(), kept.tools.size());
            unlisted.insert(connector->id());
            catalogs.push_back(std::move(kept));
            continue;
        }
        LOG_DEBUG("Rebuild: backend {} offers {} tools", connector->id(), tools->size());
        catalogs.push_back(BackendCatalog{connector->id(), std::move(*tools)});
    }

    {
        std::lock_guard lock(unlisted_mutex_);
        unlisted_ = std::move(unlisted);
    }

    auto merged = Registry::merge(catalogs);
    if (!merged) {
        co_return make_fail(merged.error());
    }
    co_return std::move(*merged);
}

auto RegistryStore::unlisted_backends() const -> std::set<std::string> {
    std::lock_guard lock(unlisted_mutex_);
    return unlisted_;
}

auto RegistryStore::persist(const Registry& registry) const -> VoidResult {
    return persist(registry, path_);
}

auto RegistryStore::load() const -> LoadResult {
    return load(path_, known_backends_);
}

auto RegistryStore::persist(const Registry& registry, const std::filesystem::path& path)
    -> VoidResult {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Cannot create registry directory", ec.message()));
        }
    }

    if (std::filesystem::exists(path, ec)) {
        // An unreadable primary must not overwrite a good backup.
        bool parses = false;
        {
            std::ifstream in(path);
            parses = in.is_open() && json::accept(in);
        }
        if (!parses) {
            LOG_WARN("Registry file {} is unreadable; not backing it up", path.string());
        } else {
            std::filesystem::copy_file(path, backup_path(path),
                std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                LOG_WARN("Failed to back up registry to {}: {}",
                         backup_path(path).string(), ec.message());
            }
        }
    }

    auto tmp_path = std::filesystem::path(path.string() + ".tmp");
    try {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Failed to open registry temp file", tmp_path.string()));
        }
        out << registry.to_json().dump(2) << '\n';
        out.close();
        if (!out) {
            throw std::runtime_error("write failed");
        }

        std::filesystem::rename(tmp_path, path);
    } catch (const std::exception& e) {
        std::filesystem::remove(tmp_path, ec);
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to write registry file", e.what()));
    }

    LOG_INFO("Persisted registry ({} tools) to {}", registry.total_tools(), path.string());
    return {};
}

auto RegistryStore::read_file(const std::filesystem::path& path,
                              const std::set<std::string>& known_backends)
    -> Result<Registry> {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Registry file not found", path.string()));
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::RegistryCorrupt,
            "Registry file is not valid JSON", e.what()));
    }

    try {
        return Registry::from_json(j, known_backends);
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::RegistryCorrupt,
            "Registry file has unexpected field types", e.what()));
    }
}

auto RegistryStore::load(const std::filesystem::path& path,
                         const std::set<std::string>& known_backends) -> LoadResult {
    auto primary = read_file(path, known_backends);
    if (primary) {
        LOG_INFO("Loaded registry ({} tools) from {}", primary->total_tools(), path.string());
        return LoadResult{std::move(*primary), false, std::nullopt};
    }

    auto bak = backup_path(path);
    bool primary_missing = primary.error().code() == ErrorCode::NotFound;
    if (primary_missing && !std::filesystem::exists(bak)) {
        LOG_INFO("No registry at {}; starting empty", path.string());
        return LoadResult{};
    }
    if (!primary_missing) {
        LOG_WARN("Registry {} is corrupt ({}); trying backup", path.string(),
                 primary.error().what());
    }

    auto backup = read_file(bak, known_backends);
    if (backup) {
        LOG_WARN("Recovered registry ({} tools) from backup {}",
                 backup->total_tools(), bak.string());
        return LoadResult{std::move(*backup), true, std::nullopt};
    }

    LOG_ERROR("Registry and backup are both unusable: {}; {}",
              primary.error().what(), backup.error().what());
    return LoadResult{
        Registry{},
        false,
        make_error(ErrorCode::RegistryCorrupt,
                   "Registry and its backup are unusable",
                   std::string(primary.error().message()) + "; " +
                       std::string(backup.error().message())),
    };
}

} // namespace toolhub::registry
