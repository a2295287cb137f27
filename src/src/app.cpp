#include <config.h>

#include "env.h"

#if defined(NO_CONSOLE) && defined(_MSC_VER)
#pragma comment(linker, "/SUBSYSTEM:windows /ENTRY:wmainCRTStartup")
#endif

#ifdef _WIN32
int wmain(int argc, wchar_t *argv[])
#else
int main(int argc, char *argv[])
#endif
{
  InitializeConsole();

  try {
    Dist::Paths paths = InitializeEnvironment();
    if (paths.root.empty()) {
      return 1;
    }

    if (IsVerbose()) {
      ErrorStream() << "# QGraphic launcher " << QGRAPHIC_VERSION << std::endl;
      ErrorStream() << "# Root: " << paths.root.native() << std::endl;
    }

    std::vector<NativeString> args;
    if (argc > 1) {
      args.assign(argv + 1, argv + argc);
    }
    return RunApplication(paths, args, GetSearchPath());
  } catch (std::exception &e) {
#if defined(_WIN32) && defined(NO_CONSOLE)
    MessageBoxA(NULL, e.what(), "Error", MB_ICONERROR);
#endif
    ErrorStream() << "Error: " << e.what() << std::endl;
    return 1;
  }
}
