#include "filedrop/server/upload_locks.hpp"

namespace filedrop::server
{

    std::unique_lock<std::mutex> UploadLocks::acquire(const std::string &handle)
    {
        std::mutex *upload_mutex = nullptr;
        {
            std::lock_guard lock(mutex_);
            auto &slot = locks_[handle];
            if (!slot)
            {
                slot = std::make_unique<std::mutex>();
            }
            upload_mutex = slot.get();
        }
        // Entries are never erased, so the pointer stays valid.
        return std::unique_lock<std::mutex>(*upload_mutex);
    }

} // namespace filedrop::server
