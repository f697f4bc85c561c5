#include "platform/windows/win32_util.hpp"

#include <psapi.h>

#include "platform/process_image.hpp"

#include <iterator>

WindowResult<std::string> process_image_path(int pid) {
    win32::ScopedHandle process(
        OpenProcess(PROCESS_QUERY_INFORMATION | PROCESS_VM_READ, FALSE, static_cast<DWORD>(pid)));
    if (!process) return std::unexpected(win32::last_error("OpenProcess"));

    // Vista and later.
    wchar_t buf[MAX_PATH];
    DWORD len = static_cast<DWORD>(std::size(buf));
    if (QueryFullProcessImageNameW(process.get(), 0, buf, &len)) {
        return win32::to_utf8(std::wstring(buf, len));
    }

    // Older API; fails for a 64-bit target when this process is 32-bit.
    DWORD n = GetModuleFileNameExW(process.get(), nullptr, buf, static_cast<DWORD>(std::size(buf)));
    if (n == 0) return std::unexpected(win32::last_error("GetModuleFileNameExW"));
    return win32::to_utf8(std::wstring(buf, n));
}
