#pragma once

#include "app_settings.hpp"

namespace micviz {

// Missing keys keep the values already in st; the result is sanitized.
bool load_settings(const char* path, AppSettings& st);
bool save_settings(const char* path, const AppSettings& st);

}
