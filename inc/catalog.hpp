#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "common.hpp"

namespace NReservation {

    // Station catalog owned outside the reservation core.
    struct IResourceCatalog {
        virtual ~IResourceCatalog() = default;
        virtual std::optional<TResourceInfo> FindResource(ResourceId id) const = 0;
    };

    // User accounts owned outside the reservation core.
    struct IUserDirectory {
        virtual ~IUserDirectory() = default;
        virtual std::optional<TUserInfo> FindUser(UserId id) const = 0;
    };

    class TMemoryCatalog: public IResourceCatalog, public IUserDirectory {
    public:
        TMemoryCatalog() = default;

        void AddResource(TResourceInfo resource);
        void AddUser(TUserInfo user);

        std::optional<TResourceInfo> FindResource(ResourceId id) const override;
        std::optional<TUserInfo> FindUser(UserId id) const override;

        // Reads {"stations": [...], "users": [...]}. Entries without an "id"
        // are numbered in file order starting from 1, like a fresh table.
        // Throws std::runtime_error when the file is missing or malformed.
        void LoadSeedFile(const std::filesystem::path& path);

    private:
        mutable std::mutex Mutex_;
        std::unordered_map<ResourceId, TResourceInfo> Resources;
        std::unordered_map<UserId, TUserInfo> Users;
    };

} // namespace NReservation
