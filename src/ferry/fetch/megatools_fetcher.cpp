// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/fetch/megatools_fetcher.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/subprocess.hpp>
#include <spdlog/spdlog.h>
#include <regex>

namespace ferry::fetch {

MegatoolsFetcher::MegatoolsFetcher(std::string megadl_path)
    : megadl_path_(std::move(megadl_path)) {}

std::optional<std::filesystem::path>
MegatoolsFetcher::parse_conflict(std::string_view output) {
    static const std::regex conflict_re(R"(File already exists at ([^\r\n]+))");

    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(output.begin(), output.end(), m, conflict_re)) {
        return std::nullopt;
    }
    std::string path = m[1].str();
    while (!path.empty() && (path.back() == ' ' || path.back() == '\t')) {
        path.pop_back();
    }
    if (path.empty()) return std::nullopt;
    return std::filesystem::path(path);
}

std::expected<void, core::FetchFailure>
MegatoolsFetcher::fetch(const std::string& url, const std::filesystem::path& dest_dir,
                        std::stop_token stop) {
    using core::JobErrc;

    spdlog::debug("megadl --path {} {}", dest_dir.string(), url);
    auto result = core::run_subprocess(
        {megadl_path_, "--path", dest_dir.string(), url}, stop);

    if (!result) {
        spdlog::error("Cannot run {}: {}", megadl_path_, result.error().message());
        return std::unexpected(core::FetchFailure{
            make_error_code(JobErrc::retrieval_failure), {},
            "cannot run " + megadl_path_ + ": " + result.error().message()});
    }

    if (result->stopped) {
        return std::unexpected(core::FetchFailure{
            make_error_code(JobErrc::cancelled), {}, "download cancelled"});
    }
    if (result->success()) {
        return {};
    }

    if (auto conflict = parse_conflict(result->output)) {
        spdlog::info("megadl reports existing file {}", conflict->string());
        return std::unexpected(core::FetchFailure{
            make_error_code(JobErrc::retrieval_conflict), *conflict,
            core::last_line(result->output)});
    }

    std::string detail = core::last_line(result->output);
    if (detail.empty()) {
        detail = result->term_signal != 0
            ? "megadl killed by signal " + std::to_string(result->term_signal)
            : "megadl exited with code " + std::to_string(result->exit_code);
    }
    spdlog::warn("megadl failed for {}: {}", url, detail);
    return std::unexpected(core::FetchFailure{
        make_error_code(JobErrc::retrieval_failure), {}, std::move(detail)});
}

} // namespace ferry::fetch
