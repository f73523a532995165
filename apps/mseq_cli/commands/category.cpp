#include "category.h"

#include "../cli_context.h"

#include "mseq/app/json_views.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CategoryCliConfig {
  mseq::cli::CliConfig common;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> id;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> name;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> slug;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> parent;  // NOLINT(readability-identifier-naming)
};

std::vector<mseq::apps::Option<CategoryCliConfig>> category_options() {
  std::vector<mseq::apps::Option<CategoryCliConfig>> options = {
      {"--id", true, "Category id",
       [](CategoryCliConfig& c, const std::string& v) {
         c.id = v;
         return std::string();
       }},
      {"--name", true, "Display name",
       [](CategoryCliConfig& c, const std::string& v) {
         c.name = v;
         return std::string();
       }},
      {"--slug", true, "Slug rendered into identifiers",
       [](CategoryCliConfig& c, const std::string& v) {
         c.slug = v;
         return std::string();
       }},
      {"--parent", true, "Parent category id (makes this a subcategory)",
       [](CategoryCliConfig& c, const std::string& v) {
         c.parent = v;
         return std::string();
       }},
  };
  mseq::cli::append_common_options(options);
  return options;
}

std::string usage(const std::vector<mseq::apps::Option<CategoryCliConfig>>& options) {
  return "Usage: mseq_cli category <add|list> [options]\n" + mseq::apps::format_option_help(options);
}

}  // namespace

int cmd_category(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = category_options();
  if (argc < 3) {
    std::cerr << usage(options);
    return 1;
  }
  const std::string action = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  const auto parsed = mseq::apps::parse_options(argc, argv, options, 3);
  if (mseq::cli::report_parse_errors(parsed.errors, usage(options))) {
    return 1;
  }
  const auto& config = parsed.config;

  if (const auto error = mseq::cli::validate_cli_config(config.common); !error.empty()) {
    std::cerr << error << "\n";
    return 1;
  }

  auto ctx_result = mseq::cli::CliContext::open(config.common);
  if (!ctx_result.has_value()) {
    std::cerr << "Error: " << ctx_result.error() << "\n";
    return 1;
  }
  auto& services = ctx_result.value()->services();

  if (action == "list") {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& category : services.categories.list_all()) {
      out.push_back(mseq::app::to_json(category));
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  if (action == "add") {
    if (!config.id || !config.name || !config.slug) {
      std::cerr << "Error: category add requires --id, --name and --slug\n";
      return 1;
    }

    mseq::domain::Category category{mseq::core::CategoryId{*config.id}, *config.name,
                                    *config.slug, std::nullopt, 0};
    if (config.parent.has_value()) {
      const auto parent = services.categories.get(mseq::core::CategoryId{*config.parent});
      if (!parent.has_value()) {
        std::cerr << "Error: parent category not found: " << *config.parent << "\n";
        return 1;
      }
      category.parent_id = parent->category_id;
      category.level = parent->level + 1;
    }

    if (!services.categories.upsert(category).has_value()) {
      std::cerr << "Error: failed to store category " << category.category_id.value << "\n";
      return 1;
    }
    std::cout << mseq::app::to_json(category).dump(2) << "\n";
    return 0;
  }

  std::cerr << "Unknown category action: " << action << "\n" << usage(options);
  return 1;
}
