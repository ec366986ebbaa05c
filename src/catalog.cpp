#include <catalog.hpp>

#include <fstream>
#include <stdexcept>

namespace NReservation {

    void TMemoryCatalog::AddResource(TResourceInfo resource) {
        std::lock_guard lk(Mutex_);
        Resources[resource.Id] = std::move(resource);
    }

    void TMemoryCatalog::AddUser(TUserInfo user) {
        std::lock_guard lk(Mutex_);
        Users[user.Id] = std::move(user);
    }

    std::optional<TResourceInfo> TMemoryCatalog::FindResource(ResourceId id) const {
        std::lock_guard lk(Mutex_);
        auto it = Resources.find(id);
        if (it == Resources.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<TUserInfo> TMemoryCatalog::FindUser(UserId id) const {
        std::lock_guard lk(Mutex_);
        auto it = Users.find(id);
        if (it == Users.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void TMemoryCatalog::LoadSeedFile(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open catalog file: " + path.string());
        }

        nlohmann::json j;
        try {
            in >> j;
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Malformed catalog file " + path.string() + ": " + e.what());
        }
        if (!j.is_object()) {
            throw std::runtime_error("Catalog file must hold a JSON object: " + path.string());
        }

        try {
            if (j.contains("stations") && j["stations"].is_array()) {
                ResourceId next = 1;
                for (auto e : j["stations"]) {
                    if (!e.contains("id")) {
                        e["id"] = next;
                    }
                    TResourceInfo r;
                    FromJSON(e, r);
                    next = r.Id + 1;
                    AddResource(std::move(r));
                }
            }
            if (j.contains("users") && j["users"].is_array()) {
                UserId next = 1;
                for (auto e : j["users"]) {
                    if (!e.contains("id")) {
                        e["id"] = next;
                    }
                    TUserInfo u;
                    FromJSON(e, u);
                    next = u.Id + 1;
                    AddUser(std::move(u));
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Malformed catalog entry in " + path.string() + ": " + e.what());
        }
    }

} // namespace NReservation
