#include "generate.h"

#include "xid/core/clock.h"
#include "xid/core/id_generator.h"
#include "xid/storage/sqlite/sqlite_db.h"
#include "xid/storage/sqlite/sqlite_id_registry.h"

#include "generate_logic.h"
#include <iostream>
#include <memory>

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto config = parse_generate_args(argc, argv);

  if (config.help) {
    print_generate_usage(std::cout);
    return 0;
  }
  if (!config.args_valid) {
    return 1;
  }

  std::shared_ptr<xid::storage::sqlite::SqliteDb> db;
  std::unique_ptr<xid::storage::sqlite::SqliteIdRegistry> registry;
  if (config.db_path.has_value()) {
    auto db_result = xid::storage::sqlite::SqliteDb::open(config.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << db_result.error() << "\n";
      return 1;
    }
    db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }
    registry = std::make_unique<xid::storage::sqlite::SqliteIdRegistry>(db);
  }

  xid::core::SystemClock clock;
  return run_generate(config.request, xid::core::default_generator(), clock, registry.get(),
                      std::cout, std::cerr);
}
