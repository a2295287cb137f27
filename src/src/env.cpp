#include <config.h>

#include "env.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#else
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

extern char **environ;
#endif  // _WIN32

namespace
{
  NativeString ToNative(const std::string &ascii)
  {
    return std::filesystem::path(ascii).native();
  }

  NativeString NativeNumber(unsigned long value)
  {
#ifdef _WIN32
    return std::to_wstring(value);
#else
    return std::to_string(value);
#endif
  }

  std::optional<NativeString> GetEnvironmentValue(const std::string &name)
  {
#ifdef _WIN32
    wchar_t *value = nullptr;
    size_t size;
    if (_wdupenv_s(&value, &size, ToNative(name).c_str()) != 0 || !value)
    {
      return std::nullopt;
    }
    NativeString result = value;
    free(value);
    return result;
#else
    const char *value = std::getenv(name.c_str());
    if (!value)
    {
      return std::nullopt;
    }
    return NativeString(value);
#endif
  }
}  // namespace

std::basic_ostream<NativeChar> &ErrorStream()
{
#ifdef _WIN32
  return std::wcerr;
#else
  return std::cerr;
#endif
}

void InitializeConsole()
{
#ifdef _WIN32
  // UTF-16 stderr, so std::wcerr does not fail on non-ASCII paths
  _setmode(_fileno(stderr), _O_U16TEXT);
#endif
}

void ShowError(const NativeString &message)
{
#if defined(_WIN32) && defined(NO_CONSOLE)
  MessageBoxW(NULL, message.c_str(), L"Error", MB_ICONERROR | MB_OK);
#endif
  ErrorStream() << QGRAPHIC_NATIVE_LITERAL("Error: ") << message << std::endl;
}

bool IsVerbose()
{
  const std::optional<NativeString> value = GetEnvironmentValue(Dist::VERBOSE_ENV_VAR);
  return value && !value->empty() && *value != QGRAPHIC_NATIVE_LITERAL("0");
}

Dist::Paths MakePaths(const std::filesystem::path &exe)
{
  Dist::Paths paths;
  paths.exe = exe;
  paths.root = exe.parent_path();
  paths.venv_py_exe = paths.root / Dist::VENV_DIR / Dist::VENV_BIN_DIR / Dist::PY_EXE;
  paths.app_script = paths.root / Dist::APP_SCRIPT;
  return paths;
}

Dist::Paths InitializeEnvironment()
{
#if defined(_WIN32)
  std::wstring exe_path(MAX_PATH, L'\0');
  for (;;)
  {
    DWORD length = GetModuleFileNameW(NULL, &exe_path[0], static_cast<DWORD>(exe_path.size()));
    if (length == 0)
    {
      ShowError(L"Failed to get module file name (" + std::to_wstring(GetLastError()) + L").");
      return {};
    }
    if (length < exe_path.size())
    {
      exe_path.resize(length);
      break;
    }
    // Truncated
    exe_path.resize(exe_path.size() * 2);
  }
  return MakePaths(std::filesystem::path(exe_path));
#elif defined(__APPLE__)
  uint32_t size = 0;
  _NSGetExecutablePath(nullptr, &size);
  std::string exe_path(size, '\0');
  if (_NSGetExecutablePath(&exe_path[0], &size) != 0)
  {
    ShowError("Failed to get executable path.");
    return {};
  }
  exe_path.resize(std::strlen(exe_path.c_str()));
  std::error_code ec;
  std::filesystem::path exe = std::filesystem::weakly_canonical(exe_path, ec);
  if (ec)
  {
    ShowError("Failed to resolve " + exe_path + " (" + ec.message() + ").");
    return {};
  }
  return MakePaths(exe);
#else
  std::error_code ec;
  std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec)
  {
    ShowError("Failed to read /proc/self/exe (" + ec.message() + ").");
    return {};
  }
  return MakePaths(exe);
#endif
}

NativeString GetSearchPath()
{
  return GetEnvironmentValue(Dist::SEARCH_PATH_ENV_VAR).value_or(NativeString());
}

std::optional<std::filesystem::path> FindOnSearchPath(const std::filesystem::path &name,
                                                      const NativeString &search_path)
{
#ifdef _WIN32
  const NativeChar separator = L';';
#else
  const NativeChar separator = ':';
#endif

  size_t begin = 0;
  while (begin <= search_path.size())
  {
    size_t end = search_path.find(separator, begin);
    if (end == NativeString::npos)
    {
      end = search_path.size();
    }
    NativeString entry = search_path.substr(begin, end - begin);
    begin = end + 1;

#ifdef _WIN32
    if (entry.size() >= 2 && entry.front() == L'"' && entry.back() == L'"')
    {
      entry = entry.substr(1, entry.size() - 2);
    }
#endif
    if (entry.empty())
    {
      continue;
    }

    std::filesystem::path candidate = std::filesystem::path(entry) / name;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec))
    {
      continue;
    }
#ifndef _WIN32
    if (access(candidate.c_str(), X_OK) != 0)
    {
      continue;
    }
#endif
    return candidate;
  }
  return std::nullopt;
}

std::optional<Interpreter> ResolveInterpreter(const Dist::Paths &paths, const NativeString &search_path)
{
  std::error_code ec;
  if (!paths.venv_py_exe.empty() && std::filesystem::is_regular_file(paths.venv_py_exe, ec))
  {
    return Interpreter{paths.venv_py_exe, InterpreterKind::Local};
  }

  for (const auto &name : Dist::SYSTEM_PY_EXES)
  {
    std::optional<std::filesystem::path> found = FindOnSearchPath(name, search_path);
    if (found)
    {
      return Interpreter{*found, InterpreterKind::System};
    }
  }
  return std::nullopt;
}

std::vector<NativeString> ForwardedArguments(const Dist::Paths &paths, const std::vector<NativeString> &args)
{
  std::vector<NativeString> result;
  result.reserve(args.size() + 1);
  result.push_back(paths.app_script.native());
  result.insert(result.end(), args.begin(), args.end());
  return result;
}

std::wstring QuoteArgument(const std::wstring &arg)
{
  if (arg.empty())
  {
    return L"\"\"";
  }
  if (arg.find_first_of(L" \t\n\v\"") == std::wstring::npos)
  {
    return arg;
  }

  std::wstring out;
  out.reserve(arg.size() + 2);
  out += L'"';
  size_t backslashes = 0;
  for (wchar_t c : arg)
  {
    if (c == L'\\')
    {
      ++backslashes;
    }
    else if (c == L'"')
    {
      // Escape the pending backslashes and the quote itself
      out.append(backslashes * 2 + 1, L'\\');
      out += L'"';
      backslashes = 0;
    }
    else
    {
      out.append(backslashes, L'\\');
      backslashes = 0;
      out += c;
    }
  }
  // Backslashes before the closing quote must be doubled
  out.append(backslashes * 2, L'\\');
  out += L'"';
  return out;
}

int LaunchProcess(const std::filesystem::path &exe_path, const std::vector<NativeString> &args)
{
  if (exe_path.empty())
  {
    ShowError(QGRAPHIC_NATIVE_LITERAL("Empty executable path."));
    return Dist::EXIT_LAUNCH_FAILED;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(exe_path, ec))
  {
    ShowError(exe_path.native() + QGRAPHIC_NATIVE_LITERAL(" not found."));
    return Dist::EXIT_INTERPRETER_NOT_FOUND;
  }

#ifdef _WIN32
  // Prepare the command line for CreateProcessW
  std::wstring cmd = QuoteArgument(exe_path.wstring());
  for (const auto &arg : args)
  {
    cmd += L" ";
    cmd += QuoteArgument(arg);
  }

  STARTUPINFOW si;
  PROCESS_INFORMATION pi;
  ZeroMemory(&si, sizeof(si));
  si.cb = sizeof(si);
  ZeroMemory(&pi, sizeof(pi));

  if (!CreateProcessW(exe_path.c_str(), &cmd[0], NULL, NULL, FALSE, 0, NULL, NULL, &si, &pi))
  {
    ShowError(L"Failed to start " + exe_path.wstring() + L" (CreateProcess error " +
              std::to_wstring(GetLastError()) + L").");
    return Dist::EXIT_LAUNCH_FAILED;
  }

  // Wait until child process exits.
  WaitForSingleObject(pi.hProcess, INFINITE);

  DWORD code = 0;
  BOOL has_code = GetExitCodeProcess(pi.hProcess, &code);
  DWORD error = GetLastError();

  CloseHandle(pi.hProcess);
  CloseHandle(pi.hThread);

  if (!has_code)
  {
    ShowError(L"Failed to get the exit code of " + exe_path.wstring() + L" (" + std::to_wstring(error) + L").");
    return 1;
  }
  return static_cast<int>(code);
#else
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(exe_path.c_str()));
  for (const auto &arg : args)
  {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid;
  const int error = posix_spawn(&pid, exe_path.c_str(), nullptr, nullptr, argv.data(), environ);
  if (error != 0)
  {
    ShowError("Failed to start " + exe_path.native() + " (" + std::strerror(error) + ").");
    return Dist::EXIT_LAUNCH_FAILED;
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0)
  {
    if (errno != EINTR)
    {
      ShowError("Failed to wait for " + exe_path.native() + " (" + std::strerror(errno) + ").");
      return 1;
    }
  }
  if (WIFEXITED(status))
  {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status))
  {
    return 128 + WTERMSIG(status);
  }
  return 1;
#endif
}

int RunApplication(const Dist::Paths &paths, const std::vector<NativeString> &args, const NativeString &search_path)
{
  const std::optional<Interpreter> interpreter = ResolveInterpreter(paths, search_path);
  if (!interpreter)
  {
    NativeString names;
    for (const auto &name : Dist::SYSTEM_PY_EXES)
    {
      if (!names.empty())
      {
        names += QGRAPHIC_NATIVE_LITERAL(", ");
      }
      names += name.native();
    }
    ShowError(QGRAPHIC_NATIVE_LITERAL("Python interpreter not found. Tried ") + paths.venv_py_exe.native() +
              QGRAPHIC_NATIVE_LITERAL(" and ") + names + QGRAPHIC_NATIVE_LITERAL(" on ") +
              ToNative(Dist::SEARCH_PATH_ENV_VAR) + QGRAPHIC_NATIVE_LITERAL("."));
    return Dist::EXIT_INTERPRETER_NOT_FOUND;
  }

  const std::vector<NativeString> forwarded = ForwardedArguments(paths, args);
  if (IsVerbose())
  {
    std::basic_ostream<NativeChar> &log = ErrorStream();
    log << QGRAPHIC_NATIVE_LITERAL("# Interpreter: ") << interpreter->path.native()
        << (interpreter->kind == InterpreterKind::Local ? QGRAPHIC_NATIVE_LITERAL(" (local)")
                                                        : QGRAPHIC_NATIVE_LITERAL(" (system)"))
        << std::endl;
    log << QGRAPHIC_NATIVE_LITERAL("# Arguments (") << NativeNumber(forwarded.size())
        << QGRAPHIC_NATIVE_LITERAL("):");
    for (const auto &arg : forwarded)
    {
      log << QGRAPHIC_NATIVE_LITERAL(" ") << arg;
    }
    log << std::endl;
  }

  return LaunchProcess(interpreter->path, forwarded);
}
