// nearby_sim: runs the nearby-friends pipeline against simulated sources.

#include <cstdio>

#include "app/app_services.h"

int main(int argc, char** argv) {
  nearby::AppOptions options;
  char err[128] = {0};
  if (!nearby::parse_app_options(argc, argv, &options, err, sizeof(err))) {
    std::fprintf(stderr, "%s\n", err);
    nearby::print_usage(argv[0]);
    return 2;
  }
  if (options.show_help) {
    nearby::print_usage(argv[0]);
    return 0;
  }

  nearby::AppServices app;
  if (!app.init(options)) {
    return 1;
  }
  return app.run();
}
