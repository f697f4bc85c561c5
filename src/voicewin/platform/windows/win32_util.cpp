#include "platform/windows/win32_util.hpp"

#include <format>

namespace win32 {

std::string to_utf8(const std::wstring& text) {
    if (text.empty()) return {};
    int len = WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                                  nullptr, 0, nullptr, nullptr);
    std::string out(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                        out.data(), len, nullptr, nullptr);
    return out;
}

WindowError last_error(const char* call) {
    return WindowError{WindowErrc::native_call_failed,
                       std::format("{} failed: error {}", call, GetLastError())};
}

} // namespace win32
