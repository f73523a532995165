#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mseq::apps {

// One flag of a subcommand. The handler stores the value into Config and
// returns "" or a message saying why the value was rejected.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<std::string(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;       // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

namespace detail {

template <typename Config>
const Option<Config>* find_option(const std::vector<Option<Config>>& options,
                                  std::string_view name) {
  for (const auto& opt : options) {
    if (opt.name == name) {
      return &opt;
    }
  }
  return nullptr;
}

}  // namespace detail

// Walks argv[start..argc-1]. A value is taken from "--flag=value" or from the
// next token. Tokens not starting with '-' are positionals. Parsing never stops
// early; every unknown flag, missing value and rejected value lands in errors.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, {}};

  for (int i = start; i < argc; ++i) {
    const std::string token = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (token.size() < 2 || token[0] != '-') {
      parsed.positionals.push_back(token);
      continue;
    }

    const auto equals = token.find('=');
    const std::string name = token.substr(0, equals);
    const Option<Config>* opt = detail::find_option(options, name);
    if (opt == nullptr) {
      parsed.errors.push_back("Unknown option: " + name);
      continue;
    }

    std::string value;
    if (equals != std::string::npos) {
      if (!opt->requires_value) {
        parsed.errors.push_back("Option " + name + " takes no value");
        continue;
      }
      value = token.substr(equals + 1);
    } else if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + name + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    if (auto error = opt->handler(parsed.config, value); !error.empty()) {
      parsed.errors.push_back(std::move(error));
    }
  }

  return parsed;
}

// Usage text, one entry per option.
template <typename Config>
std::string format_option_help(const std::vector<Option<Config>>& options) {
  std::ostringstream out;
  for (const auto& opt : options) {
    out << "  " << opt.name;
    if (opt.requires_value) {
      out << " <value>";
    }
    out << "\n      " << opt.description << "\n";
  }
  return out.str();
}

}  // namespace mseq::apps
