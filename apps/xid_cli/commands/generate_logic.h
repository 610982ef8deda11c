#pragma once

#include "xid/core/clock.h"
#include "xid/core/id_generator.h"
#include "xid/storage/id_registry.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

enum class OutputFormat : std::uint8_t {
  kText,  // one id per line
  kJson,  // JSON array of ids
};

// parse_output_format accepts "text" or "json".
[[nodiscard]] std::optional<OutputFormat> parse_output_format(std::string_view s);

struct GenerateRequest {
  std::size_t count{1};                              // NOLINT(readability-identifier-naming)
  std::optional<xid::core::Concurrency> concurrency;  // NOLINT(readability-identifier-naming)
  OutputFormat format{OutputFormat::kText};          // NOLINT(readability-identifier-naming)
  std::string label;                                 // NOLINT(readability-identifier-naming)
};

// execute_generate mints request.count ids (pure random when concurrency is empty) and
// prints them to out. Each id is also recorded when registry is non-null.
// Takes only interface types so tests can drive it with deterministic collaborators.
int execute_generate(const GenerateRequest& request, xid::core::IIdGenerator& generator,
                     xid::core::IClock& clock, xid::storage::IIdRegistry* registry,
                     std::ostream& out);

// GenerateCliConfig is the parsed form of `xid_cli generate` arguments.
struct GenerateCliConfig {
  GenerateRequest request;               // NOLINT(readability-identifier-naming)
  std::optional<std::string> db_path;    // NOLINT(readability-identifier-naming)
  bool help{false};                      // NOLINT(readability-identifier-naming)
  bool args_valid{true};                 // NOLINT(readability-identifier-naming)
};

// parse_generate_args reads argv[2..]. args_valid is false after any out-of-range value,
// unknown flag or flag missing its value; diagnostics go to stderr.
[[nodiscard]] GenerateCliConfig parse_generate_args(int argc,
                                                    char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

void print_generate_usage(std::ostream& os);

// run_generate calls execute_generate and maps failures to exit codes:
// 2 when no randomness could be obtained, 1 when recording fails. Nothing is written to
// out in either case.
int run_generate(const GenerateRequest& request, xid::core::IIdGenerator& generator,
                 xid::core::IClock& clock, xid::storage::IIdRegistry* registry, std::ostream& out,
                 std::ostream& err);
