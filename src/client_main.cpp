// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/client_application.hpp"
#include "app/options.hpp"
#include "util/logging.hpp"
#include "version.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = ipbeacon::app::ParseClientOptions(args);

    switch (parsed.status) {
    case ipbeacon::app::ParseStatus::Help:
      std::cout << ipbeacon::app::ClientUsage(argv[0]);
      return 0;
    case ipbeacon::app::ParseStatus::Version:
      std::cout << ipbeacon::GetFullVersionString() << std::endl;
      std::cout << ipbeacon::GetCopyrightString() << std::endl;
      return 0;
    case ipbeacon::app::ParseStatus::Error:
      std::cerr << "Error: " << parsed.error << "\n"
                << "Run '" << argv[0] << " --help' for usage.\n";
      return 1;
    case ipbeacon::app::ParseStatus::Ok:
      break;
    }

    const auto& options = parsed.options;
    ipbeacon::util::LogManager::Initialize(options.loglevel, !options.logfile.empty(),
                                           options.logfile.empty() ? "ipbeacon.log" : options.logfile);

    int exit_code = 1;
    {
      ipbeacon::app::ClientApplication app(options);
      if (app.initialize()) {
        exit_code = app.run();
      }
    }

    ipbeacon::util::LogManager::Shutdown();
    return exit_code;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
