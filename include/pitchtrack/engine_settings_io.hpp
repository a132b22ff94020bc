#pragma once

#include <vector>

#include "engine_settings.hpp"

namespace pitchtrack {

// Settings persist as a small JSON document. Loading only touches `st` when
// the file parses into valid settings; `profile` (optional) receives a stored
// noise profile, left empty when the file has none.
bool load_engine_settings(const char* path, EngineSettings& st, std::vector<float>* profile = nullptr);
bool save_engine_settings(const char* path, const EngineSettings& st, const std::vector<float>* profile = nullptr);

}
