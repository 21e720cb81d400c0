// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/interfaces.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::fetch {

// Retrieves Mega links with megatools' `megadl`.
class MegatoolsFetcher final : public core::Fetcher {
public:
    explicit MegatoolsFetcher(std::string megadl_path = "megadl");

    [[nodiscard]] std::expected<void, core::FetchFailure>
    fetch(const std::string& url, const std::filesystem::path& dest_dir,
          std::stop_token stop) override;

    // Path named by a "File already exists at <path>" line, if any
    [[nodiscard]] static std::optional<std::filesystem::path>
    parse_conflict(std::string_view output);

private:
    std::string megadl_path_;
};

} // namespace ferry::fetch
