#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace filedrop::server
{

    // One mutex per upload handle. Every mutation of an upload's registry
    // row, ledger and stats happens while holding it.
    class UploadLocks
    {
    public:
        std::unique_lock<std::mutex> acquire(const std::string &handle);

    private:
        std::mutex mutex_;
        std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
    };

} // namespace filedrop::server
