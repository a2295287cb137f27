#ifndef ENV_H
#define ENV_H

#ifdef _WIN32
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#endif  // _WIN32
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "dist.h"

// Strings in the platform's native encoding: UTF-16 on Windows, bytes elsewhere.
using NativeString = std::filesystem::path::string_type;
using NativeChar = NativeString::value_type;

#ifdef _WIN32
#define QGRAPHIC_NATIVE_LITERAL(s) L##s
#else
#define QGRAPHIC_NATIVE_LITERAL(s) s
#endif

enum class InterpreterKind
{
    Local,
    System
};

struct Interpreter
{
    std::filesystem::path path;
    InterpreterKind kind;
};

// Error stream matching NativeString: std::wcerr on Windows, std::cerr elsewhere.
std::basic_ostream<NativeChar> &ErrorStream();

// Switches the Windows error stream to UTF-16 output. No-op elsewhere.
void InitializeConsole();

// Writes "Error: <message>" to the error stream. Windowed builds also show a message box.
void ShowError(const NativeString &message);

// True when QGRAPHIC_LAUNCHER_VERBOSE is set to anything but "" or "0".
bool IsVerbose();

/**
 * @brief Derives the distribution layout from the launcher executable path.
 * @param exe Absolute path of the launcher executable.
 */
Dist::Paths MakePaths(const std::filesystem::path &exe);

/**
 * @brief Locates the running executable and derives the distribution layout.
 * @return The layout paths, or an empty Dist::Paths if the module path could
 * not be determined (the error has already been reported).
 */
Dist::Paths InitializeEnvironment();

// Current value of PATH, empty when unset.
NativeString GetSearchPath();

/**
 * @brief Searches the entries of a PATH-style list for an executable file.
 *
 * Entries are separated by ';' on Windows and ':' elsewhere. Empty entries are
 * skipped. On POSIX a candidate must also be executable by the caller.
 *
 * @return Path of the first match, or std::nullopt.
 */
std::optional<std::filesystem::path> FindOnSearchPath(const std::filesystem::path &name,
                                                      const NativeString &search_path);

/**
 * @brief Picks the interpreter to run.
 *
 * The virtual environment interpreter wins whenever it exists as a regular
 * file, executable or not. Otherwise Dist::SYSTEM_PY_EXES are looked up, in
 * order, on search_path.
 */
std::optional<Interpreter> ResolveInterpreter(const Dist::Paths &paths, const NativeString &search_path);

// [app_script] + args
std::vector<NativeString> ForwardedArguments(const Dist::Paths &paths, const std::vector<NativeString> &args);

// Quotes a single argument so CommandLineToArgvW and the MSVC runtime read it back unchanged.
std::wstring QuoteArgument(const std::wstring &arg);

/**
 * @brief Runs exe_path with args, inheriting the environment and standard
 * streams, and waits for it to finish.
 * @return The child's exit code, 128 + signal number if it was killed by a
 * signal, or Dist::EXIT_LAUNCH_FAILED if it could not be started.
 */
int LaunchProcess(const std::filesystem::path &exe_path, const std::vector<NativeString> &args);

/**
 * @brief Resolves the interpreter and runs the application script with args.
 * @return The application's exit status, or Dist::EXIT_INTERPRETER_NOT_FOUND
 * when no interpreter could be found (nothing is spawned in that case).
 */
int RunApplication(const Dist::Paths &paths, const std::vector<NativeString> &args, const NativeString &search_path);

#endif  // ENV_H
