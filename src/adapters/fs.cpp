#include "fs.hpp"
#include "utf8.hpp"
#include <array>
#include <fstream>
#include <system_error>
#include <fmt/core.h>

namespace lazycp::adapters::fs {

auto is_binary(const std::filesystem::path& path) -> bool {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return true;
    }

    std::array<char, binary_probe_size> probe{};
    ifs.read(probe.data(), probe.size());
    const auto got = static_cast<std::size_t>(ifs.gcount());

    text::Utf8Validator validator;
    if (!validator.feed(std::span<const char>(probe.data(), got))) {
        return true;
    }

    // Дочитываем хвост символа, разрезанного на 16-м байте
    char ch = 0;
    while (validator.pending() && ifs.get(ch)) {
        if (!validator.feed(std::span<const char>(&ch, 1))) {
            return true;
        }
    }
    return !validator.complete();
}

auto file_size(const std::filesystem::path& path) -> infra::Result<std::uintmax_t> {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec, fmt::format("Cannot stat {}", path.string())));
    }
    return size;
}

auto ensure_directory(const std::filesystem::path& dir) -> infra::Result<bool> {
    std::error_code ec;
    const bool created = std::filesystem::create_directory(dir, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec, fmt::format("Cannot create directory {}", dir.string())));
    }
    // create_directory не сообщает об ошибке, если по пути уже лежит файл
    if (!std::filesystem::is_directory(dir, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyExists,
                                                 fmt::format("{} exists and is not a directory", dir.string())));
    }
    return created;
}

auto replicate_symlink(const std::filesystem::path& src,
                       const std::filesystem::path& dst)
    -> infra::Result<std::filesystem::path>
{
    std::error_code ec;
    auto target = std::filesystem::read_symlink(src, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec, fmt::format("Cannot read link {}", src.string())));
    }

    std::filesystem::create_symlink(target, dst, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec, fmt::format("Cannot create link {}", dst.string())));
    }
    return target;
}

auto prepare_destination(const std::filesystem::path& dest) -> infra::Result<bool> {
    std::error_code ec;
    if (dest.has_extension() || std::filesystem::exists(std::filesystem::symlink_status(dest, ec))) {
        return false;
    }

    std::filesystem::create_directory(dest, ec);
    if (ec) {
        return std::unexpected(infra::make_error_from(ec, fmt::format("Cannot create destination {}", dest.string())));
    }
    return true;
}

auto resolve_destination(const std::filesystem::path& src,
                         const std::filesystem::path& dest)
    -> std::filesystem::path
{
    std::error_code ec;
    if (std::filesystem::is_directory(dest, ec)) {
        auto name = src.filename();
        if (name.empty()) {
            name = src.parent_path().filename(); // "dir/" -> "dir"
        }
        return dest / name;
    }
    return dest;
}

} // namespace lazycp::adapters::fs
