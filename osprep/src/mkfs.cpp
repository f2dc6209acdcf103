#include "osprep/mkfs.hpp"
#include "osprep/mkfs_flags.hpp"
#include "osprep/string_utils.hpp"

#include <algorithm>    // for any_of
#include <array>        // for array
#include <filesystem>   // for exists
#include <iterator>     // for back_inserter
#include <string_view>  // for string_view
#include <utility>      // for move, pair

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// mkfs.btrfs of this release has no force flag, later releases do
static constexpr auto LEGACY_BTRFS_CODENAME = "precise"sv;

static constexpr std::array<std::string_view, 3> FAT_SIZES{"12"sv, "16"sv, "32"sv};

void append_args(std::vector<std::string>& cmd, std::vector<std::string>&& args) noexcept {
    std::ranges::move(args, std::back_inserter(cmd));
}

auto get_optional_string(const rapidjson::Document& doc, const char* member) noexcept
    -> osprep::Result<std::optional<std::string>> {
    if (!doc.HasMember(member) || doc[member].IsNull()) {
        return std::optional<std::string>{};
    }
    if (!doc[member].IsString()) {
        return osprep::make_error(osprep::ErrorKind::Configuration, fmt::format(FMT_COMPILE("'{}' must be a string"), member));
    }
    return std::make_optional<std::string>(doc[member].GetString(), doc[member].GetStringLength());
}

}  // namespace

namespace osprep::fs {

auto build_mkfs_command(const MkfsRequest& request, std::string_view platform_codename) noexcept
    -> Result<std::vector<std::string>> {
    const auto fs_family = fs::family_of(request.fstype);
    const auto mkfs_cmd  = fs::mkfs_command_for(request.fstype);
    if (!mkfs_cmd) {
        return make_error(ErrorKind::UnsupportedFilesystem, fmt::format(FMT_COMPILE("unsupported fs type '{}'"), request.fstype));
    }

    std::vector<std::string> cmd{std::string{*mkfs_cmd}};

    if (request.force) {
        if (platform_codename == LEGACY_BTRFS_CODENAME && fs_family == "btrfs"sv) {
            spdlog::debug("[mkfs] {} on '{}' has no force flag, skipping it", *mkfs_cmd, platform_codename);
        } else {
            auto force_args = fs::resolve_flag(MkfsFlag::Force, fs_family, std::nullopt, request.strict);
            if (!force_args) {
                return std::unexpected(std::move(force_args.error()));
            }
            append_args(cmd, std::move(*force_args));
        }
    }

    if (request.label) {
        const auto limit = fs::label_length_limit(fs_family);
        if (!limit) {
            return make_error(ErrorKind::Configuration, fmt::format(FMT_COMPILE("no label length limit known for fs family '{}'"), fs_family));
        }

        std::string_view label{*request.label};
        if (utils::utf8_length(label) > *limit) {
            if (request.strict) {
                return make_error(ErrorKind::LabelTooLong,
                    fmt::format(FMT_COMPILE("length of fs label for '{}' exceeds max allowed for fstype '{}'. max is '{}'"),
                        request.path, request.fstype, *limit));
            }
            label = utils::utf8_prefix(label, *limit);
            spdlog::debug("[mkfs] label truncated to '{}'", label);
        }

        auto label_args = fs::resolve_flag(MkfsFlag::Label, fs_family, label, request.strict);
        if (!label_args) {
            return std::unexpected(std::move(label_args.error()));
        }
        append_args(cmd, std::move(*label_args));
    }

    if (request.uuid) {
        auto uuid_args = fs::resolve_flag(MkfsFlag::Uuid, fs_family, *request.uuid, request.strict);
        if (!uuid_args) {
            return std::unexpected(std::move(uuid_args.error()));
        }
        append_args(cmd, std::move(*uuid_args));
    }

    if (fs_family == "fat"sv) {
        const auto fat_size = utils::strip_ascii_letters(request.fstype);
        if (std::ranges::any_of(FAT_SIZES, [fat_size](auto&& size) { return size == fat_size; })) {
            auto fatsize_args = fs::resolve_flag(MkfsFlag::FatSize, fs_family, fat_size, request.strict);
            if (!fatsize_args) {
                return std::unexpected(std::move(fatsize_args.error()));
            }
            append_args(cmd, std::move(*fatsize_args));
        }
    }

    cmd.emplace_back(request.path);
    return cmd;
}

auto make_filesystem(const MkfsRequest& request, utils::Executor& executor) noexcept -> Result<void> {
    if (request.path.empty()) {
        return make_error(ErrorKind::InvalidPath, fmt::format(FMT_COMPILE("invalid block dev path '{}'"), request.path));
    }
    std::error_code err{};
    if (!std::filesystem::exists(request.path, err)) {
        return make_error(ErrorKind::InvalidPath, fmt::format(FMT_COMPILE("'{}': no such file or directory"), request.path));
    }

    const auto mkfs_cmd = fs::mkfs_command_for(request.fstype);
    if (!mkfs_cmd) {
        return make_error(ErrorKind::UnsupportedFilesystem, fmt::format(FMT_COMPILE("unsupported fs type '{}'"), request.fstype));
    }
    if (!executor.locate(*mkfs_cmd)) {
        return make_error(ErrorKind::ToolNotFound, fmt::format(FMT_COMPILE("need '{}' but it could not be found"), *mkfs_cmd));
    }

    const auto& platform_codename = request.force ? executor.platform_codename() : std::string{};
    const auto& cmd               = fs::build_mkfs_command(request, platform_codename);
    if (!cmd) {
        return std::unexpected(cmd.error());
    }

    spdlog::info("Creating {} filesystem on '{}'", request.fstype, request.path);
    spdlog::debug("[mkfs] cmd := {}", *cmd);
    const auto& output = executor.execute(*cmd);
    if (!output) {
        spdlog::error("Failed to create {} filesystem on '{}': {}", request.fstype, request.path, output.error().message);
        return std::unexpected(output.error());
    }
    return {};
}

auto make_filesystem_from_config(std::string_view path, const FilesystemInfo& info, bool strict,
    utils::Executor& executor) noexcept -> Result<void> {
    if (!info.fstype) {
        return make_error(ErrorKind::MissingField, "fstype must be specified");
    }

    const MkfsRequest request{
        .path   = std::string{path},
        .fstype = *info.fstype,
        .label  = info.label,
        .uuid   = info.uuid,
        .force  = true,
        .strict = strict,
    };
    return fs::make_filesystem(request, executor);
}

auto parse_filesystem_info(std::string_view json_content) noexcept -> Result<FilesystemInfo> {
    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return make_error(ErrorKind::Configuration,
            fmt::format(FMT_COMPILE("JSON parse error at offset {}: {}"), doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return make_error(ErrorKind::Configuration, "JSON root must be an object");
    }

    FilesystemInfo info{};
    for (auto&& [member, field] : {std::pair{"fstype", &info.fstype}, std::pair{"uuid", &info.uuid}, std::pair{"label", &info.label}}) {
        auto value = get_optional_string(doc, member);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        *field = std::move(*value);
    }
    return info;
}

}  // namespace osprep::fs
