#pragma once

#include "report.hpp"

#include <filesystem>
#include <string>

namespace pseudo_mt {

bool write_markdown_report(const std::filesystem::path& out_path, const TranslationReport& report, std::string& error);

}  // namespace pseudo_mt
