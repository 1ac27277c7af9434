#pragma once

#include "app_settings.hpp"

// Console rendition of the live metrics: runs a session and prints a
// one-line meter at ~60 Hz until SIGINT. Returns the process exit code.
int run_headless(const micviz::AppSettings& settings);
