#pragma once

#include "window_error.hpp"

#include <string>

// Full path of the executable image of process `pid`.
WindowResult<std::string> process_image_path(int pid);
