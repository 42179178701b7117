/**
 * @file device_profile.cpp
 * @brief Device memory detection
 */

#include "kcenon/bulk_upload/core/device_profile.h"

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace kcenon::bulk_upload {

auto physical_memory_bytes() -> std::optional<uint64_t> {
#if defined(_WIN32)
    MEMORYSTATUSEX status{};
    status.dwLength = sizeof(status);
    if (GlobalMemoryStatusEx(&status) == 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(status.ullTotalPhys);
#else
    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages <= 0 || page_size <= 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
#endif
}

auto default_batch_size() -> std::size_t {
    return batch_size_for_memory(physical_memory_bytes());
}

}  // namespace kcenon::bulk_upload
