#pragma once
#include <filesystem>
#include <string_view>

namespace gitreplay {

class Repository; // fwd

// Materialize tree `tree_hex` under `output_dir`: blobs become files (mode
// 100755 keeps its execute bits), sub-trees become directories. Symlink and
// submodule entries are skipped. Runs on an explicit work-list, so tree depth
// does not grow the call stack.
//
// Throws ExportIOError on any filesystem failure; already written files are
// left in place. Object-store failures surface as ObjectError.
void export_tree(const Repository& repo, std::string_view tree_hex,
                 const std::filesystem::path& output_dir);

} // namespace gitreplay
