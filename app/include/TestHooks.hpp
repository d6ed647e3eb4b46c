#pragma once

#include <filesystem>
#include <functional>

namespace TestHooks {

// Called by FileScanner for every regular file after it was enumerated and
// before its FileDescriptor is created.
using ScanEntryProbe = std::function<void(const std::filesystem::path& entry_path)>;
void set_scan_entry_probe(ScanEntryProbe probe);
void reset_scan_entry_probe();

} // namespace TestHooks
