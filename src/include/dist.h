#ifndef DIST_H
#define DIST_H

#include <filesystem>
#include <string>
#include <vector>

namespace Dist
{
    // Directory constants
    const std::filesystem::path VENV_DIR = ".venv";
#ifdef _WIN32
    const std::filesystem::path VENV_BIN_DIR = "Scripts";
#else
    const std::filesystem::path VENV_BIN_DIR = "bin";
#endif

    // File & Executable constants
#ifdef _WIN32
    const std::filesystem::path PY_EXE = "python.exe";
    const std::vector<std::filesystem::path> SYSTEM_PY_EXES = {"python.exe"};
#else
    const std::filesystem::path PY_EXE = "python";
    const std::vector<std::filesystem::path> SYSTEM_PY_EXES = {"python3", "python"};
#endif
    const std::filesystem::path APP_SCRIPT = "qgraphic.py";

    // Environment variables
    const std::string SEARCH_PATH_ENV_VAR = "PATH";
    const std::string VERBOSE_ENV_VAR = "QGRAPHIC_LAUNCHER_VERBOSE";

    // Exit codes, matching what the host shell reports for the same failures
#ifdef _WIN32
    constexpr int EXIT_INTERPRETER_NOT_FOUND = 9009;
#else
    constexpr int EXIT_INTERPRETER_NOT_FOUND = 127;
#endif
    constexpr int EXIT_LAUNCH_FAILED = 126;

    struct Paths
    {
        std::filesystem::path exe;
        std::filesystem::path root;

        std::filesystem::path venv_py_exe;
        std::filesystem::path app_script;
    };
}

#endif // DIST_H
