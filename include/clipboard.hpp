#pragma once
#include "keyspot_common.hpp"
#include "logging.hpp"

#include <string>

// -------- Clipboard API exposed to main --------

// Read current clipboard text into 'out' (single read, no monitoring).
bool clipboard_get(std::string& out);

// WSL detection
bool running_in_wsl();
