#include "generate_logic.h"

#include "xid/core/id_json.h"
#include "xid/core/random_source.h"

#include "shared/arg_parser.h"
#include <nlohmann/json.hpp>

#include <charconv>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

constexpr std::size_t kMaxCount = 100000;

std::vector<xid::apps::Option<GenerateCliConfig>> build_options() {
  return {
      {"--count", true, "Number of ids to generate (1-100000, default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         std::size_t count = 0;
         const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), count);
         if (ec != std::errc{} || ptr != v.data() + v.size() || count == 0 ||
             count > kMaxCount) {
           std::cerr << "Invalid --count: " << v << " (valid: 1-" << kMaxCount << ")\n";
           c.args_valid = false;
           return false;
         }
         c.request.count = count;
         return true;
       }},
      {"--mode", true, "Uniqueness mode (random|nano|low|medium|high, default random)",
       [](GenerateCliConfig& c, const std::string& v) {
         if (v == "random") {
           c.request.concurrency = std::nullopt;
           return true;
         }
         auto level = xid::core::parse_concurrency(v);
         if (!level.has_value()) {
           std::cerr << "Invalid --mode: " << v << " (valid: random, nano, low, medium, high)\n";
           c.args_valid = false;
           return false;
         }
         c.request.concurrency = level;
         return true;
       }},
      {"--format", true, "Output format (text|json, default text)",
       [](GenerateCliConfig& c, const std::string& v) {
         auto format = parse_output_format(v);
         if (!format.has_value()) {
           std::cerr << "Invalid --format: " << v << " (valid: text, json)\n";
           c.args_valid = false;
           return false;
         }
         c.request.format = format.value();
         return true;
       }},
      {"--db", true, "Record generated ids in this SQLite database",
       [](GenerateCliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--label", true, "Label stored with each recorded id",
       [](GenerateCliConfig& c, const std::string& v) {
         c.request.label = v;
         return true;
       }},
      {"--help", false, "Show this help",
       [](GenerateCliConfig& c, const std::string& /*v*/) {
         c.help = true;
         return true;
       }},
  };
}

}  // namespace

std::optional<OutputFormat> parse_output_format(std::string_view s) {
  if (s == "text") {
    return OutputFormat::kText;
  }
  if (s == "json") {
    return OutputFormat::kJson;
  }
  return std::nullopt;
}

int execute_generate(const GenerateRequest& request, xid::core::IIdGenerator& generator,
                     xid::core::IClock& clock, xid::storage::IIdRegistry* registry,
                     std::ostream& out) {
  std::vector<xid::core::Id> ids;
  ids.reserve(request.count);
  for (std::size_t i = 0; i < request.count; ++i) {
    ids.push_back(request.concurrency.has_value() ? generator.next(request.concurrency.value())
                                                  : generator.next());
  }

  if (registry != nullptr) {
    const auto created_at = clock.now_iso8601();
    std::vector<xid::storage::IdRecord> records;
    records.reserve(ids.size());
    for (const auto& id : ids) {
      records.push_back({id, request.label, created_at});
    }
    registry->record_all(records);
  }

  switch (request.format) {
    case OutputFormat::kJson:
      out << nlohmann::json(ids).dump(2) << "\n";
      break;
    case OutputFormat::kText:
      for (const auto& id : ids) {
        out << id << "\n";
      }
      break;
  }
  return 0;
}

GenerateCliConfig parse_generate_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_options();
  bool args_ok = true;
  auto config = xid::apps::parse_options(argc, argv, options, 2, GenerateCliConfig{}, nullptr,
                                         &args_ok);
  config.args_valid = config.args_valid && args_ok;
  return config;
}

void print_generate_usage(std::ostream& os) {
  xid::apps::print_usage(os, "xid_cli generate [options]", build_options());
}

int run_generate(const GenerateRequest& request, xid::core::IIdGenerator& generator,
                 xid::core::IClock& clock, xid::storage::IIdRegistry* registry, std::ostream& out,
                 std::ostream& err) {
  try {
    return execute_generate(request, generator, clock, registry, out);
  } catch (const xid::core::RandomSourceError& e) {
    err << "Fatal: " << e.what() << "\n";
    return 2;
  } catch (const std::runtime_error& e) {
    err << "Error: " << e.what() << "\n";
    return 1;
  }
}
