#ifndef PREVIEW_SERVICE_HPP
#define PREVIEW_SERVICE_HPP

#include "utils/config.hpp"

// Start the gateway, register every configured project and serve until
// ENTER is pressed. Returns the process exit code.
int start_preview_service(const PreviewConfig &config);

// Validate the config and every project descriptor without opening ports.
// Returns the number of problems found.
int check_config(const PreviewConfig &config);

#endif // PREVIEW_SERVICE_HPP
