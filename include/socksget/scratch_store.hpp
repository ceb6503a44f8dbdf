#pragma once

#include "chunk_planner.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace socksget {

// Owns the partial files of one download:
//   <scratch_dir>/<output file name>.progress.<chunk index>
// A partial file appears only once its chunk is complete and is removed only
// after the output file has been assembled.
class ScratchStore {
public:
    // Empty scratch_dir selects the system temp directory.
    ScratchStore(std::filesystem::path scratch_dir, const std::string& output_filename);

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }
    [[nodiscard]] std::filesystem::path partialPath(std::size_t index) const;

    [[nodiscard]] bool isResumable(const ByteRange& range) const;

    // Writes to a temporary sibling and renames it into place. Throws ScratchError.
    void write(std::size_t index, std::string_view bytes) const;

    // Indices of chunks whose partial file is missing or mis-sized.
    [[nodiscard]] std::vector<std::size_t> verify(const DownloadPlan& plan) const;

    // Concatenates every partial file in range order into output, then
    // removes them. output is created through a temporary and renamed, so an
    // interrupted assembly leaves neither output nor lost partials. Throws
    // ScratchError.
    void assemble(const DownloadPlan& plan, const std::filesystem::path& output) const;

    void discard(const DownloadPlan& plan) const;

private:
    std::filesystem::path dir_;
    std::string base_name_;
};

} // namespace socksget
