#pragma once

#include <memory>
#include <string>
#include "netsleuth/fs/filesystem.h"

namespace netsleuth::fs {

// stdio-backed filesystem rooted at `rootDir`.
std::unique_ptr<IFileSystem>
create_stdio_filesystem(const std::string& rootDir, const std::string& name);

} // namespace netsleuth::fs
