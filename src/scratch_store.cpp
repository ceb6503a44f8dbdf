#include "socksget/scratch_store.hpp"

#include "socksget/errors.hpp"
#include "socksget/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace socksget {

namespace fs = std::filesystem;

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

FilePtr openFile(const fs::path& path, const char* mode) {
    FilePtr file{std::fopen(path.c_str(), mode)};
    if (!file) {
        throw ScratchError(fmt::format("Cannot open {}: {}", path.string(), std::strerror(errno)));
    }
    return file;
}

void closeFile(FilePtr& file, const fs::path& path) {
    FILE* raw = file.release();
    if (std::fflush(raw) != 0 || std::fclose(raw) != 0) {
        throw ScratchError(fmt::format("Cannot write {}: {}", path.string(), std::strerror(errno)));
    }
}

void renameInto(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        fs::remove(from, ec);
        throw ScratchError(fmt::format("Cannot move {} to {}: {}", from.string(), to.string(), ec.message()));
    }
}

} // namespace

ScratchStore::ScratchStore(fs::path scratch_dir, const std::string& output_filename)
    : dir_(std::move(scratch_dir)), base_name_(fs::path(output_filename).filename().string()) {
    if (dir_.empty()) {
        std::error_code ec;
        dir_ = fs::temp_directory_path(ec);
        if (ec) {
            dir_ = "/tmp";
        }
    }
    if (base_name_.empty()) {
        throw ConfigError("Output filename has no file name component: " + output_filename);
    }
}

fs::path ScratchStore::partialPath(std::size_t index) const {
    return dir_ / fmt::format("{}.progress.{}", base_name_, index);
}

bool ScratchStore::isResumable(const ByteRange& range) const {
    return socksget::isResumable(range, partialPath(range.index));
}

void ScratchStore::write(std::size_t index, std::string_view bytes) const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw ScratchError(fmt::format("Cannot create scratch directory {}: {}", dir_.string(), ec.message()));
    }

    const fs::path target = partialPath(index);
    fs::path temp = target;
    temp += ".part";

    auto file = openFile(temp, "wb");
    if (!bytes.empty() && std::fwrite(bytes.data(), 1, bytes.size(), file.get()) != bytes.size()) {
        file.reset();
        fs::remove(temp, ec);
        throw ScratchError(fmt::format("Short write to {}", temp.string()));
    }
    closeFile(file, temp);
    renameInto(temp, target);
}

std::vector<std::size_t> ScratchStore::verify(const DownloadPlan& plan) const {
    std::vector<std::size_t> bad;
    for (const auto& range : plan.ranges) {
        if (!isResumable(range)) {
            logger()->error("Progress file {} is missing or has incorrect size", partialPath(range.index).string());
            bad.push_back(range.index);
        }
    }
    return bad;
}

void ScratchStore::assemble(const DownloadPlan& plan, const fs::path& output) const {
    fs::path temp = output;
    temp += ".part";

    try {
        auto out = openFile(temp, "wb");
        std::vector<char> buffer(1 << 16);
        for (const auto& range : plan.ranges) {
            const fs::path partial = partialPath(range.index);
            auto in = openFile(partial, "rb");

            std::uint64_t copied = 0;
            std::size_t n = 0;
            while ((n = std::fread(buffer.data(), 1, buffer.size(), in.get())) > 0) {
                if (std::fwrite(buffer.data(), 1, n, out.get()) != n) {
                    throw ScratchError(fmt::format("Short write to {}", temp.string()));
                }
                copied += n;
            }
            if (copied != range.length()) {
                throw ScratchError(fmt::format("{} changed during assembly: read {} of {} bytes",
                                               partial.string(), copied, range.length()));
            }
        }
        closeFile(out, temp);
    } catch (const ScratchError&) {
        std::error_code ec;
        fs::remove(temp, ec);
        throw;
    }
    renameInto(temp, output);

    discard(plan);
}

void ScratchStore::discard(const DownloadPlan& plan) const {
    for (const auto& range : plan.ranges) {
        std::error_code ec;
        fs::remove(partialPath(range.index), ec);
        if (ec) {
            logger()->warn("Cannot remove {}: {}", partialPath(range.index).string(), ec.message());
        }
    }
}

} // namespace socksget
