// Win32 implementation of blocking subprocess execution (CreateProcessW, Unicode)

#ifdef _WIN32

#include "process.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <cstdlib>
#include <filesystem>
#include <thread>
#include <windows.h>

namespace mcpcommons::process
{

namespace
{

/// Closes the wrapped handle on scope exit
struct ScopedHandle
{
    HANDLE handle = INVALID_HANDLE_VALUE;

    ScopedHandle() = default;
    explicit ScopedHandle(HANDLE h) : handle(h) {}
    ScopedHandle(const ScopedHandle&) = delete;
    ScopedHandle& operator=(const ScopedHandle&) = delete;

    ~ScopedHandle()
    {
        reset();
    }

    void reset()
    {
        if (handle != INVALID_HANDLE_VALUE && handle != nullptr)
            CloseHandle(handle);
        handle = INVALID_HANDLE_VALUE;
    }
};

std::wstring utf8_to_wide(const std::string& utf8)
{
    if (utf8.empty())
        return {};
    int size =
        MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), static_cast<int>(utf8.size()), nullptr, 0);
    if (size <= 0)
        return {};
    std::wstring wide(static_cast<size_t>(size), 0);
    MultiByteToWideChar(CP_UTF8, 0, utf8.c_str(), static_cast<int>(utf8.size()), &wide[0], size);
    return wide;
}

std::string get_last_error_message()
{
    DWORD error = GetLastError();
    if (error == 0)
        return "No error";

    LPSTR buffer = nullptr;
    size_t size = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                                     FORMAT_MESSAGE_IGNORE_INSERTS,
                                 nullptr, error, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                                 reinterpret_cast<LPSTR>(&buffer), 0, nullptr);

    std::string message(buffer, size);
    LocalFree(buffer);

    while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
        message.pop_back();

    return message;
}

std::string quote_argument(const std::string& arg)
{
    bool needs_quotes = arg.empty();
    for (char c : arg)
    {
        if (c == ' ' || c == '\t' || c == '"')
        {
            needs_quotes = true;
            break;
        }
    }

    if (!needs_quotes)
        return arg;

    std::string result = "\"";
    for (size_t i = 0; i < arg.size(); ++i)
    {
        if (arg[i] == '"')
        {
            result += "\\\"";
        }
        else if (arg[i] == '\\')
        {
            size_t num_backslashes = 1;
            while (i + num_backslashes < arg.size() && arg[i + num_backslashes] == '\\')
                ++num_backslashes;
            if (i + num_backslashes == arg.size() || arg[i + num_backslashes] == '"')
                result.append(num_backslashes * 2, '\\');
            else
                result.append(num_backslashes, '\\');
            i += num_backslashes - 1;
        }
        else
        {
            result += arg[i];
        }
    }
    result += "\"";
    return result;
}

std::string build_command_line(const std::string& executable,
                               const std::vector<std::string>& args)
{
    std::string cmdline = quote_argument(executable);
    for (const auto& arg : args)
        cmdline += " " + quote_argument(arg);
    return cmdline;
}

void read_all(HANDLE pipe, std::string& sink)
{
    char buffer[4096];
    DWORD bytes_read = 0;
    while (ReadFile(pipe, buffer, sizeof(buffer), &bytes_read, nullptr) && bytes_read > 0)
        sink.append(buffer, bytes_read);
}

void create_pipe(ScopedHandle& read_end, ScopedHandle& write_end, const char* what)
{
    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    HANDLE r = INVALID_HANDLE_VALUE;
    HANDLE w = INVALID_HANDLE_VALUE;
    if (!CreatePipe(&r, &w, &sa, 0))
        throw ProcessError(std::string("Failed to create ") + what +
                           " pipe: " + get_last_error_message());
    read_end.handle = r;
    write_end.handle = w;
    // Parent's end must not leak into the child
    SetHandleInformation(r, HANDLE_FLAG_INHERIT, 0);
}

} // namespace

ProcessResult run(const std::string& executable, const std::vector<std::string>& args)
{
    std::string resolved = executable;
    if (auto found = find_executable(executable))
        resolved = *found;

    ScopedHandle stdout_read, stdout_write, stderr_read, stderr_write;
    create_pipe(stdout_read, stdout_write, "stdout");
    create_pipe(stderr_read, stderr_write, "stderr");

    SECURITY_ATTRIBUTES null_sa;
    null_sa.nLength = sizeof(null_sa);
    null_sa.bInheritHandle = TRUE;
    null_sa.lpSecurityDescriptor = nullptr;
    ScopedHandle null_input(CreateFileW(L"NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                                        &null_sa, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr));

    STARTUPINFOW si;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = null_input.handle;
    si.hStdOutput = stdout_write.handle;
    si.hStdError = stderr_write.handle;

    std::wstring cmdline_wide = utf8_to_wide(build_command_line(resolved, args));

    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));

    BOOL success = CreateProcessW(nullptr, &cmdline_wide[0], nullptr, nullptr, TRUE,
                                  CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);

    // Close child's ends of pipes so ReadFile sees EOF when it exits
    stdout_write.reset();
    stderr_write.reset();
    null_input.reset();

    if (!success)
        throw ProcessError("Failed to execute '" + executable + "': " + get_last_error_message());

    ScopedHandle process(pi.hProcess);
    ScopedHandle thread(pi.hThread);

    ProcessResult result;
    std::thread stderr_reader([&]() { read_all(stderr_read.handle, result.error_output); });
    read_all(stdout_read.handle, result.output);
    stderr_reader.join();

    if (WaitForSingleObject(process.handle, INFINITE) != WAIT_OBJECT_0)
        throw ProcessError("WaitForSingleObject failed: " + get_last_error_message());

    DWORD exit_code = 0;
    if (!GetExitCodeProcess(process.handle, &exit_code))
        throw ProcessError("GetExitCodeProcess failed: " + get_last_error_message());
    result.exit_code = static_cast<int>(exit_code);
    return result;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;
    std::error_code ec;

    if (fs::path(name).is_absolute())
    {
        if (fs::exists(name, ec))
            return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::vector<std::string> extensions;
    if (const char* pathext_env = std::getenv("PATHEXT"))
    {
        std::string pathext(pathext_env);
        size_t start = 0;
        size_t end;
        while ((end = pathext.find(';', start)) != std::string::npos)
        {
            extensions.push_back(pathext.substr(start, end - start));
            start = end + 1;
        }
        extensions.push_back(pathext.substr(start));
    }
    else
    {
        extensions = {".COM", ".EXE", ".BAT", ".CMD"};
    }

    std::string path(path_env);
    size_t start = 0;
    while (start <= path.size())
    {
        size_t end = path.find(';', start);
        if (end == std::string::npos)
            end = path.size();
        std::string dir = path.substr(start, end - start);
        start = end + 1;
        if (dir.empty())
            continue;

        for (const auto& ext : extensions)
        {
            fs::path candidate = fs::path(dir) / (name + ext);
            if (fs::exists(candidate, ec))
                return candidate.string();
        }

        fs::path candidate = fs::path(dir) / name;
        if (fs::exists(candidate, ec))
            return candidate.string();
    }

    return std::nullopt;
}

} // namespace mcpcommons::process

#endif // _WIN32
