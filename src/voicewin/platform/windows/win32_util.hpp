#pragma once

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include "window_error.hpp"

#include <cstdint>
#include <string>

namespace win32 {

inline HWND to_hwnd(WindowId id) {
    return reinterpret_cast<HWND>(static_cast<uintptr_t>(id));
}

inline WindowId to_id(HWND hwnd) {
    return static_cast<WindowId>(reinterpret_cast<uintptr_t>(hwnd));
}

std::string to_utf8(const std::wstring& text);

// native_call_failed carrying GetLastError() of the failed call.
WindowError last_error(const char* call);

// Owns a kernel HANDLE; closes it on every exit path.
class ScopedHandle {
public:
    explicit ScopedHandle(HANDLE handle) : handle_(handle) {}
    ~ScopedHandle() {
        if (handle_) CloseHandle(handle_);
    }

    ScopedHandle(const ScopedHandle&) = delete;
    ScopedHandle& operator=(const ScopedHandle&) = delete;

    HANDLE get() const { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    HANDLE handle_;
};

} // namespace win32
